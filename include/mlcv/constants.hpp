#pragma once

#include <cstddef>
#include <cstdint>

/// @file include/mlcv/constants.hpp
/// @brief Numerical defaults and tolerances for the MLCV library.

namespace mlcv::constants {

// ─── TICA ─────────────────────────────────────────────────────────────────────

/// Default diagonal regularization added to C(0) before the Cholesky step.
static constexpr double DEFAULT_REG_C0 = 1e-6;

/// Smallest eigenvalue gap used when back-propagating into eigenvectors.
/// Gaps below this are floored (sign preserved) so gradients stay finite.
static constexpr double EIGENGAP_FLOOR = 1e-10;

/// C(0) counts as singular when its smallest Cholesky pivot is at most
/// SINGULAR_PIVOT_ULPS · d · ε · max_i C(0)_ii. Covers the few ulps of
/// rounding left in the last pivot of an exactly singular matrix.
static constexpr double SINGULAR_PIVOT_ULPS = 16.0;

// ─── Normalization ────────────────────────────────────────────────────────────

/// Ranges (std or half-width) below this are treated as 1 to avoid division
/// by zero on constant features.
static constexpr double MIN_NORMALIZATION_RANGE = 1e-12;

// ─── Training ─────────────────────────────────────────────────────────────────

/// Default Adam learning rate.
static constexpr double DEFAULT_LEARNING_RATE = 1e-3;

/// Adam moment decay rates and denominator epsilon.
static constexpr double ADAM_BETA1   = 0.9;
static constexpr double ADAM_BETA2   = 0.999;
static constexpr double ADAM_EPSILON = 1e-8;

/// Seed used for weight initialization and batch shuffling unless overridden.
static constexpr std::uint64_t DEFAULT_SEED = 42;

/// Default number of paired samples per training batch.
static constexpr std::size_t DEFAULT_BATCH_SIZE = 10000;

// ─── Comparisons ──────────────────────────────────────────────────────────────

/// General floating-point comparison epsilon.
static constexpr double FLOAT_EPSILON = 1e-12;

} // namespace mlcv::constants
