#pragma once

/// @file include/mlcv/normalization.hpp
/// @brief NormalizationBlock — affine standardization with running statistics.
///
/// # Module: Normalization
///
/// ## Formula
///   y = (x − mean) / range
///
/// where, per feature,
///   - MeanStd: mean = sample mean, range = sample std (Bessel-corrected)
///   - MinMax:  mean = (max + min)/2, range = (max − min)/2, mapping to [−1, 1]
///
/// ## Lifecycle
/// - Training-mode `forward` folds each batch into running moments
///   (Chan/Welford merge).
/// - `on_train_epoch_start` clears the moments.
/// - `on_train_epoch_end` replaces mean/range with the accumulated values,
///   except for quantities fixed through `NormalizationOptions`.
/// - Until the first epoch ends the block is the identity (mean 0, range 1).
///
/// ## Edge Cases
/// - range < MIN_NORMALIZATION_RANGE (constant feature): range = 1
/// - fewer than 2 samples for MeanStd: range = 1

#include "mlcv/blocks.hpp"

#include <optional>
#include <string_view>

namespace mlcv::blocks {

enum class NormalizationMode { MeanStd, MinMax };

[[nodiscard]] std::string_view to_string(NormalizationMode mode) noexcept;

/// Parse "mean_std" / "min_max". Returns nullopt for anything else.
[[nodiscard]] std::optional<NormalizationMode>
parse_normalization_mode(std::string_view text) noexcept;

/// Constructor options for NormalizationBlock.
struct NormalizationOptions {
    NormalizationMode        mode = NormalizationMode::MeanStd;
    std::optional<RowVector> mean;   ///< Fixed mean; never updated from data
    std::optional<RowVector> range;  ///< Fixed range; never updated from data
};

class NormalizationBlock final : public Block {
public:
    /// Throws `ConfigurationError` if features < 1 or a fixed mean/range has
    /// the wrong width or a non-positive range entry.
    explicit NormalizationBlock(Eigen::Index features,
                                NormalizationOptions options = {});

    /// Standardize x; in training mode also accumulate statistics.
    [[nodiscard]] Matrix forward(const Matrix& x) override;

    /// Standardize without touching the statistics.
    [[nodiscard]] Matrix apply(const Matrix& x) const;

    /// Undo the standardization: x = y · range + mean.
    [[nodiscard]] Matrix inverse(const Matrix& y) const;

    void on_train_epoch_start() override;
    void on_train_epoch_end() override;

    /// Replace non-fixed mean/range with the accumulated statistics.
    /// No-op when nothing was accumulated.
    void set_from_stats();

    /// Set and fix both mean and range.
    /// Throws `ConfigurationError` for wrong sizes, a non-finite mean, or a
    /// range entry that is not finite and positive.
    void set_params(RowVector mean, RowVector range);

    [[nodiscard]] Eigen::Index in_features() const noexcept override { return features_; }
    [[nodiscard]] Eigen::Index out_features() const noexcept override { return features_; }
    [[nodiscard]] std::string_view kind() const noexcept override { return "normalization"; }

    [[nodiscard]] const RowVector& mean() const noexcept { return mean_; }
    [[nodiscard]] const RowVector& range() const noexcept { return range_; }
    [[nodiscard]] NormalizationMode mode() const noexcept { return mode_; }

    /// Samples accumulated since the last epoch start.
    [[nodiscard]] double samples_seen() const noexcept { return count_; }

private:
    void accumulate(const Matrix& x);
    void reset_moments();

    Eigen::Index      features_;
    NormalizationMode mode_;
    RowVector         mean_;
    RowVector         range_;
    bool              fixed_mean_  = false;
    bool              fixed_range_ = false;

    double    count_ = 0.0;
    RowVector run_mean_;
    RowVector run_m2_;
    RowVector run_min_;
    RowVector run_max_;
};

} // namespace mlcv::blocks
