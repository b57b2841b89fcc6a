#pragma once

/// @file include/mlcv/metrics.hpp
/// @brief Training diagnostics sinks.
///
/// # Module: Metrics
///
/// ## Responsibility
/// Receive `(name, value, step)` records from models and the trainer:
///   - `MemorySink`    — keeps every record, for tests and post-processing
///   - `ConsoleSink`   — prints each record with fmt
///   - `CsvSink`       — appends `step,name,value` rows to a file
///   - `EpochAverager` — forwards to another sink and emits per-epoch means
///
/// ## NOT Responsible For
/// - Deciding what is logged (models and the trainer do)

#include <cstddef>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mlcv::core {

struct MetricRecord {
    std::string name;
    double      value = 0.0;
    std::size_t step  = 0;
};

/// Destination for scalar diagnostics.
class MetricsSink {
public:
    virtual ~MetricsSink() = default;

    virtual void record(std::string_view name, double value, std::size_t step) = 0;
};

// ─── MemorySink ───────────────────────────────────────────────────────────────

class MemorySink final : public MetricsSink {
public:
    void record(std::string_view name, double value, std::size_t step) override;

    [[nodiscard]] const std::vector<MetricRecord>& records() const noexcept { return records_; }

    /// All values recorded under `name`, in arrival order.
    [[nodiscard]] std::vector<double> values(std::string_view name) const;

    /// Most recent value recorded under `name`.
    [[nodiscard]] std::optional<double> last(std::string_view name) const;

    [[nodiscard]] bool contains(std::string_view name) const;

    void clear() noexcept { records_.clear(); }

private:
    std::vector<MetricRecord> records_;
};

// ─── ConsoleSink ──────────────────────────────────────────────────────────────

/// Prints `[step N] name = value` to stderr, leaving stdout for CV output.
class ConsoleSink final : public MetricsSink {
public:
    void record(std::string_view name, double value, std::size_t step) override;
};

// ─── CsvSink ──────────────────────────────────────────────────────────────────

/// Writes a `step,name,value` header, then one row per record.
class CsvSink final : public MetricsSink {
public:
    /// Throws `std::runtime_error` if the file cannot be opened for writing.
    explicit CsvSink(const std::string& path);

    void record(std::string_view name, double value, std::size_t step) override;

private:
    std::ofstream out_;
};

// ─── EpochAverager ────────────────────────────────────────────────────────────

/// Forwards every record unchanged and accumulates per-name sums; `flush`
/// emits `{name}_epoch` = mean since the previous flush.
class EpochAverager final : public MetricsSink {
public:
    /// `inner` may be null, in which case records are only accumulated.
    explicit EpochAverager(std::shared_ptr<MetricsSink> inner);

    void record(std::string_view name, double value, std::size_t step) override;

    /// Emit the epoch means at `epoch` and reset the accumulators. Returns the
    /// means keyed by base name.
    std::map<std::string, double> flush(std::size_t epoch);

private:
    struct Accumulator {
        double      sum   = 0.0;
        std::size_t count = 0;
    };

    std::shared_ptr<MetricsSink>       inner_;
    std::map<std::string, Accumulator> sums_;
};

} // namespace mlcv::core
