/// @file src/blocks/normalization.cpp
/// @brief NormalizationBlock — affine standardization with running statistics.
///
/// Statistics are merged batch by batch (Chan et al. parallel variance):
///   δ    = mean_b − mean_a
///   mean = mean_a + δ · n_b / n
///   M2   = M2_a + M2_b + δ² · n_a · n_b / n
/// and applied only at epoch end, so forward() is a fixed affine map within
/// an epoch.

#include "mlcv/normalization.hpp"
#include "mlcv/constants.hpp"
#include "mlcv/errors.hpp"

#include <fmt/core.h>

#include <cmath>
#include <limits>

namespace mlcv::blocks {

// ─── Internal helpers ─────────────────────────────────────────────────────────

namespace {

/// Replace degenerate (tiny or non-finite) ranges by 1.
[[nodiscard]] RowVector safe_range(RowVector range) {
    for (Eigen::Index j = 0; j < range.size(); ++j) {
        if (!std::isfinite(range(j)) || range(j) < constants::MIN_NORMALIZATION_RANGE) {
            range(j) = 1.0;
        }
    }
    return range;
}

/// Explicit ranges are divisors: every entry must be finite and positive.
void check_range(const RowVector& range) {
    for (Eigen::Index j = 0; j < range.size(); ++j) {
        if (!std::isfinite(range(j)) || range(j) <= 0.0) {
            throw ConfigurationError(fmt::format(
                "normalization range entry {} is {}, expected finite and positive",
                j, range(j)));
        }
    }
}

} // anonymous namespace

// ─── NormalizationMode ────────────────────────────────────────────────────────

std::string_view to_string(NormalizationMode mode) noexcept {
    switch (mode) {
        case NormalizationMode::MeanStd: return "mean_std";
        case NormalizationMode::MinMax:  return "min_max";
    }
    return "mean_std";
}

std::optional<NormalizationMode> parse_normalization_mode(std::string_view text) noexcept {
    if (text == "mean_std") return NormalizationMode::MeanStd;
    if (text == "min_max")  return NormalizationMode::MinMax;
    return std::nullopt;
}

// ─── Constructor ──────────────────────────────────────────────────────────────

NormalizationBlock::NormalizationBlock(Eigen::Index features,
                                       NormalizationOptions options)
    : features_(features), mode_(options.mode) {
    if (features < 1) {
        throw ConfigurationError(fmt::format(
            "normalization block needs at least 1 feature, got {}", features));
    }
    mean_  = RowVector::Zero(features);
    range_ = RowVector::Ones(features);

    if (options.mean) {
        if (options.mean->size() != features) {
            throw ConfigurationError(fmt::format(
                "normalization mean has {} entries, expected {}",
                options.mean->size(), features));
        }
        mean_       = *options.mean;
        fixed_mean_ = true;
    }
    if (options.range) {
        if (options.range->size() != features) {
            throw ConfigurationError(fmt::format(
                "normalization range has {} entries, expected {}",
                options.range->size(), features));
        }
        check_range(*options.range);
        range_       = *options.range;
        fixed_range_ = true;
    }
    reset_moments();
}

// ─── forward / apply / inverse ────────────────────────────────────────────────

Matrix NormalizationBlock::forward(const Matrix& x) {
    check_input(x);
    if (is_training()) {
        accumulate(x);
    }
    return apply(x);
}

Matrix NormalizationBlock::apply(const Matrix& x) const {
    check_input(x);
    return ((x.rowwise() - mean_).array().rowwise() / range_.array()).matrix();
}

Matrix NormalizationBlock::inverse(const Matrix& y) const {
    check_input(y);
    return (y.array().rowwise() * range_.array()).matrix().rowwise() + mean_;
}

// ─── Lifecycle ────────────────────────────────────────────────────────────────

void NormalizationBlock::on_train_epoch_start() {
    reset_moments();
}

void NormalizationBlock::on_train_epoch_end() {
    set_from_stats();
}

void NormalizationBlock::set_from_stats() {
    if (count_ <= 0.0) {
        return;
    }

    RowVector mean;
    RowVector range;
    if (mode_ == NormalizationMode::MinMax) {
        mean  = 0.5 * (run_max_ + run_min_);
        range = 0.5 * (run_max_ - run_min_);
    } else {
        mean = run_mean_;
        range = (count_ >= 2.0)
            ? RowVector((run_m2_ / (count_ - 1.0)).array().sqrt())
            : RowVector::Ones(features_);
    }

    if (!fixed_mean_) {
        mean_ = mean;
    }
    if (!fixed_range_) {
        range_ = safe_range(range);
    }
}

void NormalizationBlock::set_params(RowVector mean, RowVector range) {
    if (mean.size() != features_ || range.size() != features_) {
        throw ConfigurationError(fmt::format(
            "normalization parameters have {} and {} entries, expected {}",
            mean.size(), range.size(), features_));
    }
    if (!mean.allFinite()) {
        throw ConfigurationError("normalization mean entries must be finite");
    }
    check_range(range);
    mean_        = std::move(mean);
    range_       = std::move(range);
    fixed_mean_  = true;
    fixed_range_ = true;
}

// ─── Running moments ──────────────────────────────────────────────────────────

void NormalizationBlock::accumulate(const Matrix& x) {
    if (x.rows() == 0) {
        return;
    }
    const auto n_b = static_cast<double>(x.rows());
    const RowVector mean_b = x.colwise().mean();
    const RowVector m2_b   = (x.rowwise() - mean_b).colwise().squaredNorm();

    const double n_a = count_;
    const double n   = n_a + n_b;
    const RowVector delta = mean_b - run_mean_;

    run_mean_ += delta * (n_b / n);
    run_m2_   += m2_b + (delta.array().square() * (n_a * n_b / n)).matrix();
    run_min_   = run_min_.cwiseMin(x.colwise().minCoeff());
    run_max_   = run_max_.cwiseMax(x.colwise().maxCoeff());
    count_     = n;
}

void NormalizationBlock::reset_moments() {
    count_    = 0.0;
    run_mean_ = RowVector::Zero(features_);
    run_m2_   = RowVector::Zero(features_);
    run_min_  = RowVector::Constant(features_,  std::numeric_limits<double>::infinity());
    run_max_  = RowVector::Constant(features_, -std::numeric_limits<double>::infinity());
}

} // namespace mlcv::blocks
