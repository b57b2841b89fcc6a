/// @file src/core/dataset.cpp
/// @brief Time-lagged pairing, labelled datasets and the train/valid
///        data module.

#include "mlcv/dataset.hpp"
#include "mlcv/errors.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace mlcv::core {

// ─── build_timelagged_dataset ─────────────────────────────────────────────────

TimeLagBatch build_timelagged_dataset(const Matrix& x, Eigen::Index lag,
                                      const std::optional<Vector>& weights) {
    const Eigen::Index n = x.rows();
    if (lag < 1 || lag >= n) {
        throw ConfigurationError(fmt::format(
            "lag time {} must lie in [1, {}) for a trajectory of {} samples",
            lag, n, n));
    }
    if (weights && weights->size() != n) {
        throw ShapeMismatchError(fmt::format(
            "{} weights given for a trajectory of {} samples", weights->size(), n));
    }

    const Eigen::Index pairs = n - lag;
    TimeLagBatch out;
    out.data     = x.topRows(pairs);
    out.data_lag = x.bottomRows(pairs);
    if (weights) {
        out.weights     = weights->head(pairs);
        out.weights_lag = weights->tail(pairs);
    } else {
        out.weights     = uniform_weights(pairs);
        out.weights_lag = uniform_weights(pairs);
    }
    return out;
}

// ─── build_labeled_dataset ────────────────────────────────────────────────────

LabeledBatch build_labeled_dataset(const Matrix& x, const Matrix& y) {
    if (x.rows() == 0 || x.cols() == 0 || y.cols() == 0) {
        throw ShapeMismatchError(fmt::format(
            "labelled dataset needs non-empty inputs and targets, got {}x{} and {}x{}",
            x.rows(), x.cols(), y.rows(), y.cols()));
    }
    if (x.rows() != y.rows()) {
        throw ShapeMismatchError(fmt::format(
            "{} input rows but {} target rows", x.rows(), y.rows()));
    }
    return LabeledBatch{.data = x, .labels = y};
}

// ─── select_rows ──────────────────────────────────────────────────────────────

namespace {

void check_row(Eigen::Index r, Eigen::Index size) {
    if (r < 0 || r >= size) {
        throw ShapeMismatchError(fmt::format(
            "row {} out of range for a dataset of {} samples", r, size));
    }
}

} // anonymous namespace

TimeLagBatch select_rows(const TimeLagBatch& dataset,
                         const std::vector<Eigen::Index>& rows) {
    const auto n = static_cast<Eigen::Index>(rows.size());
    TimeLagBatch out;
    out.data.resize(n, dataset.data.cols());
    out.data_lag.resize(n, dataset.data_lag.cols());
    out.weights.resize(n);
    out.weights_lag.resize(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const Eigen::Index r = rows[static_cast<std::size_t>(i)];
        check_row(r, dataset.size());
        out.data.row(i)     = dataset.data.row(r);
        out.data_lag.row(i) = dataset.data_lag.row(r);
        out.weights(i)      = dataset.weights(r);
        out.weights_lag(i)  = dataset.weights_lag(r);
    }
    return out;
}

LabeledBatch select_rows(const LabeledBatch& dataset,
                         const std::vector<Eigen::Index>& rows) {
    const auto n = static_cast<Eigen::Index>(rows.size());
    LabeledBatch out;
    out.data.resize(n, dataset.data.cols());
    out.labels.resize(n, dataset.labels.cols());
    for (Eigen::Index i = 0; i < n; ++i) {
        const Eigen::Index r = rows[static_cast<std::size_t>(i)];
        check_row(r, dataset.size());
        out.data.row(i)   = dataset.data.row(r);
        out.labels.row(i) = dataset.labels.row(r);
    }
    return out;
}

// ─── BasicDataModule ──────────────────────────────────────────────────────────

template <typename Batch>
BasicDataModule<Batch>::BasicDataModule(Batch dataset, DataModuleOptions options)
    : dataset_(std::move(dataset)), options_(options), rng_(options.seed) {
    if (options_.batch_size < 1) {
        throw ConfigurationError(fmt::format(
            "batch size must be >= 1, got {}", options_.batch_size));
    }
    if (!(options_.valid_fraction >= 0.0 && options_.valid_fraction < 1.0)) {
        throw ConfigurationError(fmt::format(
            "validation fraction must lie in [0, 1), got {}", options_.valid_fraction));
    }

    const Eigen::Index n = dataset_.size();
    const auto n_valid = static_cast<Eigen::Index>(
        std::floor(options_.valid_fraction * static_cast<double>(n)));
    if (n - n_valid < 1) {
        throw ConfigurationError(fmt::format(
            "dataset of {} samples leaves no training samples", n));
    }

    std::vector<Eigen::Index> order(static_cast<std::size_t>(n));
    std::iota(order.begin(), order.end(), Eigen::Index{0});
    if (n_valid > 0) {
        std::shuffle(order.begin(), order.end(), rng_);
    }
    valid_rows_.assign(order.begin(), order.begin() + n_valid);
    train_rows_.assign(order.begin() + n_valid, order.end());
    std::sort(valid_rows_.begin(), valid_rows_.end());
    std::sort(train_rows_.begin(), train_rows_.end());
}

template <typename Batch>
std::vector<Batch> BasicDataModule<Batch>::train_batches() {
    if (options_.shuffle) {
        std::shuffle(train_rows_.begin(), train_rows_.end(), rng_);
    }
    return batches(train_rows_);
}

template <typename Batch>
std::vector<Batch> BasicDataModule<Batch>::valid_batches() const {
    return batches(valid_rows_);
}

template <typename Batch>
std::vector<Batch>
BasicDataModule<Batch>::batches(const std::vector<Eigen::Index>& rows) const {
    std::vector<Batch> out;
    const auto total = rows.size();
    const auto step  = static_cast<std::size_t>(options_.batch_size);
    for (std::size_t start = 0; start < total; start += step) {
        const std::size_t stop = std::min(total, start + step);
        out.push_back(select_rows(dataset_, std::vector<Eigen::Index>(
            rows.begin() + static_cast<std::ptrdiff_t>(start),
            rows.begin() + static_cast<std::ptrdiff_t>(stop))));
    }
    return out;
}

template class BasicDataModule<TimeLagBatch>;
template class BasicDataModule<LabeledBatch>;

} // namespace mlcv::core
