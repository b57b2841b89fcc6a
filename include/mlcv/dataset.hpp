#pragma once

/// @file include/mlcv/dataset.hpp
/// @brief Time-lagged pairing of a trajectory, labelled datasets, and
///        minibatch delivery.
///
/// `build_timelagged_dataset` pairs sample i with sample i + lag; the result
/// has N − lag pairs. `build_labeled_dataset` attaches a target row to every
/// sample. `BasicDataModule` splits either kind into training and validation
/// subsets and cuts them into batches.

#include "mlcv/constants.hpp"
#include "mlcv/types.hpp"

#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace mlcv::core {

/// Pair row i of `x` with row i + lag.
///
/// # Arguments
/// * `x`       — Trajectory, one sample per row, in time order
/// * `lag`     — Lag time in samples, 1 ≤ lag < x.rows()
/// * `weights` — Optional per-sample weights (length x.rows()); w_t takes
///               weights[i] and w_lag takes weights[i + lag]. Unit weights if
///               absent.
///
/// # Errors
/// - `ConfigurationError` for a lag outside [1, rows)
/// - `ShapeMismatchError` if the weights have the wrong length
[[nodiscard]] TimeLagBatch build_timelagged_dataset(const Matrix& x,
                                                    Eigen::Index lag,
                                                    const std::optional<Vector>& weights = std::nullopt);

/// Inputs `x` with targets `y`, one row each.
/// Throws `ShapeMismatchError` if the row counts differ or either is empty.
[[nodiscard]] LabeledBatch build_labeled_dataset(const Matrix& x, const Matrix& y);

/// The pairs at `rows`, in the given order.
[[nodiscard]] TimeLagBatch select_rows(const TimeLagBatch& dataset,
                                       const std::vector<Eigen::Index>& rows);

/// The samples at `rows`, in the given order.
[[nodiscard]] LabeledBatch select_rows(const LabeledBatch& dataset,
                                       const std::vector<Eigen::Index>& rows);

struct DataModuleOptions {
    Eigen::Index  batch_size     = constants::DEFAULT_BATCH_SIZE;
    double        valid_fraction = 0.2;   ///< In [0, 1); 0 disables validation
    bool          shuffle        = true;  ///< Reshuffle training pairs per epoch
    std::uint64_t seed           = constants::DEFAULT_SEED;
};

/// Train/valid split and batching of a dataset of `Batch` rows.
///
/// `Batch` provides `size()` and a `select_rows(const Batch&, rows)`
/// overload. Instantiated for TimeLagBatch and LabeledBatch.
template <typename Batch>
class BasicDataModule {
public:
    /// Throws `ConfigurationError` for batch_size < 1, a valid_fraction
    /// outside [0, 1), or a split that leaves no training samples.
    explicit BasicDataModule(Batch dataset, DataModuleOptions options = {});

    /// Training batches for one epoch (reshuffled on every call when
    /// `shuffle` is set).
    [[nodiscard]] std::vector<Batch> train_batches();

    /// Validation batches, in fixed order. Empty if validation is disabled.
    [[nodiscard]] std::vector<Batch> valid_batches() const;

    [[nodiscard]] Eigen::Index train_size() const noexcept {
        return static_cast<Eigen::Index>(train_rows_.size());
    }
    [[nodiscard]] Eigen::Index valid_size() const noexcept {
        return static_cast<Eigen::Index>(valid_rows_.size());
    }
    [[nodiscard]] const Batch& dataset() const noexcept { return dataset_; }
    [[nodiscard]] const DataModuleOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] std::vector<Batch>
    batches(const std::vector<Eigen::Index>& rows) const;

    Batch                     dataset_;
    DataModuleOptions         options_;
    std::vector<Eigen::Index> train_rows_;
    std::vector<Eigen::Index> valid_rows_;
    std::mt19937_64           rng_;
};

extern template class BasicDataModule<TimeLagBatch>;
extern template class BasicDataModule<LabeledBatch>;

using DataModule        = BasicDataModule<TimeLagBatch>;
using LabeledDataModule = BasicDataModule<LabeledBatch>;

} // namespace mlcv::core
