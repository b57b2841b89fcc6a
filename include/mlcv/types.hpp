#pragma once

/// @file include/mlcv/types.hpp
/// @brief Shared value types for the MLCV collective-variable library.
///
/// All modules include this file. It defines the Eigen-based batch aliases
/// and the time-lagged sample containers passed between the data layer,
/// the pipeline and the TICA engine.
///
/// Batch convention: one sample per row, one feature per column.

#include <Eigen/Dense>

#include <vector>

namespace mlcv {

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// A batch of feature vectors, shape (batch, features).
using Matrix = Eigen::MatrixXd;

/// A column vector: per-sample weights, eigenvalues, a single mean.
using Vector = Eigen::VectorXd;

/// A single sample laid out as a row, broadcastable against a Matrix batch.
using RowVector = Eigen::RowVectorXd;

// ─── Time-lagged samples ──────────────────────────────────────────────────────

/// Two feature batches sampled at times t and t + lag, paired row-wise, with
/// nonnegative importance weights.
///
/// Invariants (checked by the estimator, not by construction):
///   - x_t.rows() == w_t.size(), x_lag.rows() == w_lag.size()
///   - x_t.rows() == x_lag.rows(), x_t.cols() == x_lag.cols()
///   - sum(w_t) > 0, sum(w_lag) > 0
struct TimeLagPair {
    Matrix x_t;     ///< Features at time t
    Matrix x_lag;   ///< Features at time t + lag
    Vector w_t;     ///< Importance weights of the x_t rows
    Vector w_lag;   ///< Importance weights of the x_lag rows
};

/// Training batch as delivered by the data layer, in raw input coordinates.
/// Field names follow the batch schema {data, data_lag, weights, weights_lag}.
struct TimeLagBatch {
    Matrix data;
    Matrix data_lag;
    Vector weights;
    Vector weights_lag;

    /// Number of paired samples in the batch.
    [[nodiscard]] Eigen::Index size() const noexcept { return data.rows(); }
};

/// Supervised batch: inputs and one target row per sample.
struct LabeledBatch {
    Matrix data;    ///< (batch, n_in)
    Matrix labels;  ///< (batch, n_out)

    [[nodiscard]] Eigen::Index size() const noexcept { return data.rows(); }
};

/// Batch of unit weights, for unbiased trajectories.
[[nodiscard]] inline Vector uniform_weights(Eigen::Index n) {
    return Vector::Ones(n);
}

/// Eigenvalues (descending) and matching eigenvector columns.
struct EigenDecomposition {
    Vector eigenvalues;   ///< Length k, sorted non-increasing
    Matrix eigenvectors;  ///< Shape (d, k), column i pairs with eigenvalues(i)
};

} // namespace mlcv
