#pragma once

/// @file include/mlcv/trace.hpp
/// @brief TracedModel — a frozen, block-free copy of a pipeline's forward map.
///
/// A trace is a flat list of three op kinds:
///   - Standardize: y = (x − mean) / range
///   - Affine:      y = x · A + b       (A is in × out)
///   - Activate:    y = σ(x)
/// Projections are affine ops with a zero bias. `forward` reproduces the
/// eager pipeline forward for the parameters captured at trace time.

#include "mlcv/feedforward.hpp"
#include "mlcv/types.hpp"

#include <string>
#include <variant>
#include <vector>

namespace mlcv::cv {

struct Standardize {
    RowVector mean;
    RowVector range;
};

struct Affine {
    Matrix    a;
    RowVector b;
};

struct Activate {
    blocks::Activation activation;
};

using TracedOp = std::variant<Standardize, Affine, Activate>;

class TracedModel {
public:
    /// Throws `ConfigurationError` if consecutive op widths disagree.
    TracedModel(Eigen::Index in_features, std::vector<TracedOp> ops);

    [[nodiscard]] Matrix forward(const Matrix& x) const;

    [[nodiscard]] Eigen::Index in_features() const noexcept { return in_features_; }
    [[nodiscard]] Eigen::Index out_features() const noexcept { return out_features_; }
    [[nodiscard]] const std::vector<TracedOp>& ops() const noexcept { return ops_; }

    /// One line per op, e.g. "affine 2 -> 10".
    [[nodiscard]] std::string to_string() const;

private:
    Eigen::Index          in_features_;
    Eigen::Index          out_features_;
    std::vector<TracedOp> ops_;
};

} // namespace mlcv::cv
