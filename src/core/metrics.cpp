/// @file src/core/metrics.cpp
/// @brief Metrics sinks.

#include "mlcv/metrics.hpp"

#include <fmt/core.h>

#include <cstdio>
#include <stdexcept>

namespace mlcv::core {

// ─── MemorySink ───────────────────────────────────────────────────────────────

void MemorySink::record(std::string_view name, double value, std::size_t step) {
    records_.push_back(MetricRecord{
        .name  = std::string(name),
        .value = value,
        .step  = step,
    });
}

std::vector<double> MemorySink::values(std::string_view name) const {
    std::vector<double> out;
    for (const auto& r : records_) {
        if (r.name == name) {
            out.push_back(r.value);
        }
    }
    return out;
}

std::optional<double> MemorySink::last(std::string_view name) const {
    for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
        if (it->name == name) {
            return it->value;
        }
    }
    return std::nullopt;
}

bool MemorySink::contains(std::string_view name) const {
    return last(name).has_value();
}

// ─── ConsoleSink ──────────────────────────────────────────────────────────────

void ConsoleSink::record(std::string_view name, double value, std::size_t step) {
    fmt::print(stderr, "[step {:6d}] {:<24} = {:.6f}\n", step, name, value);
}

// ─── CsvSink ──────────────────────────────────────────────────────────────────

CsvSink::CsvSink(const std::string& path) : out_(path) {
    if (!out_.is_open()) {
        throw std::runtime_error(fmt::format("cannot open metrics file '{}'", path));
    }
    out_ << "step,name,value\n";
}

void CsvSink::record(std::string_view name, double value, std::size_t step) {
    out_ << fmt::format("{},{},{:.10g}\n", step, name, value);
}

// ─── EpochAverager ────────────────────────────────────────────────────────────

EpochAverager::EpochAverager(std::shared_ptr<MetricsSink> inner)
    : inner_(std::move(inner)) {}

void EpochAverager::record(std::string_view name, double value, std::size_t step) {
    auto& acc = sums_[std::string(name)];
    acc.sum += value;
    ++acc.count;
    if (inner_) {
        inner_->record(name, value, step);
    }
}

std::map<std::string, double> EpochAverager::flush(std::size_t epoch) {
    std::map<std::string, double> means;
    for (const auto& [name, acc] : sums_) {
        if (acc.count == 0) {
            continue;
        }
        const double mean = acc.sum / static_cast<double>(acc.count);
        means.emplace(name, mean);
        if (inner_) {
            inner_->record(name + "_epoch", mean, epoch);
        }
    }
    sums_.clear();
    return means;
}

} // namespace mlcv::core
