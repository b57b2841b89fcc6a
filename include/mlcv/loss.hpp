#pragma once

/// @file include/mlcv/loss.hpp
/// @brief EigenvalueReducer — maps TICA eigenvalues to a scalar training signal.
///
/// # Module: Eigenvalue Loss
///
/// ## Responsibility
/// Select the leading `n_eig` eigenvalues (0 = all) of an already
/// descending-sorted vector and reduce them to one scalar. The training loss
/// is the negated reduction: maximizing autocorrelation, minimizing loss.
///
/// ## Modes
/// | mode      | value                                 | needs          |
/// |-----------|---------------------------------------|----------------|
/// | `sum`     | Σ λᵢ                                  | ≥ 1 eigenvalue |
/// | `sum2`    | Σ λᵢ²  (default)                      | ≥ 1 eigenvalue |
/// | `gap`     | λ₁ − λ₂                               | ≥ 2 selected   |
/// | `single`  | λ_last (last selected eigenvalue)     | ≥ 1 eigenvalue |
/// | `single2` | λ_last²                               | ≥ 1 eigenvalue |
/// | `its`     | Σ −1 / ln λᵢ (implied timescales/lag) | 0 < λᵢ < 1     |
///
/// ## Guarantees
/// - Pure functions, no state
/// - `gradient` is the exact derivative of `reduce`, zero outside the
///   selection

#include "mlcv/types.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

namespace mlcv::loss {

enum class ReductionMode { Sum, Sum2, Gap, Single, Single2, ImpliedTimescales };

[[nodiscard]] std::string_view to_string(ReductionMode mode) noexcept;

/// Parse "sum", "sum2", "gap", "single", "single2", "its".
[[nodiscard]] std::optional<ReductionMode> parse_reduction_mode(std::string_view text) noexcept;

/// Loss configuration: {mode, n_eig}; n_eig = 0 selects all eigenvalues.
struct LossOptions {
    ReductionMode mode  = ReductionMode::Sum2;
    std::size_t   n_eig = 0;
};

/// Eigenvalue-to-scalar reduction and its gradient.
class EigenvalueReducer {
public:
    EigenvalueReducer() = delete;

    /// Reduce the selected eigenvalues.
    ///
    /// # Errors
    /// - `ConfigurationError`        if nothing is selected, n_eig exceeds the
    ///                               available count, or `gap` sees < 2 values
    /// - `NumericalInstabilityError` for `its` with an eigenvalue outside (0, 1)
    [[nodiscard]] static double
    reduce(const Vector& eigenvalues, ReductionMode mode, std::size_t n_eig = 0);

    [[nodiscard]] static double
    reduce(const Vector& eigenvalues, const LossOptions& options) {
        return reduce(eigenvalues, options.mode, options.n_eig);
    }

    /// d reduce / d eigenvalues, same length as `eigenvalues`.
    [[nodiscard]] static Vector
    gradient(const Vector& eigenvalues, ReductionMode mode, std::size_t n_eig = 0);

    [[nodiscard]] static Vector
    gradient(const Vector& eigenvalues, const LossOptions& options) {
        return gradient(eigenvalues, options.mode, options.n_eig);
    }

private:
    /// Number of selected eigenvalues after validating n_eig and mode.
    [[nodiscard]] static Eigen::Index
    selection(const Vector& eigenvalues, ReductionMode mode, std::size_t n_eig);
};

} // namespace mlcv::loss
