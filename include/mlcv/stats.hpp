#pragma once

/// @file include/mlcv/stats.hpp
/// @brief Weighted time-lagged covariance estimation and the generalized
///        symmetric eigenproblem behind TICA.
///
/// # Module: Statistics Engine
///
/// ## Responsibility
/// Provides the two numerical kernels of the TICA engine:
///   - `CovarianceEstimator`     — C(0) and C(τ) from paired, weighted batches
///   - `GeneralizedEigenSolver`  — C(τ) v = λ C(0) v for SPD C(0)
///
/// Both kernels expose a `backward` that maps loss gradients on their outputs
/// to gradients on their inputs, so the eigenvalue loss can be propagated
/// into the featurizer that produced the batches.
///
/// ## Weighting policy
/// Weighted moments are normalized by the sum of weights, never by the
/// sample count. Centering uses the weighted mean of x_t (Instantaneous) or
/// the pooled weighted mean of x_t and x_lag (Pooled). C(τ) pairs row i of
/// x_t with row i of x_lag and weighs the pair with w_lag(i).
///
/// ## Guarantees
/// - Shape and weight problems are reported before any arithmetic
/// - A C(0) that is not positive definite after regularization throws
///   `NumericalInstabilityError`; NaN is never returned silently
/// - Eigenpairs are ordered deterministically (see `GeneralizedEigenSolver`)
///
/// ## NOT Responsible For
/// - Caching projections for inference (see include/mlcv/tica.hpp)
/// - Reducing eigenvalues to a loss (see include/mlcv/loss.hpp)

#include "mlcv/types.hpp"

#include <Eigen/Cholesky>

#include <cstddef>
#include <optional>
#include <string_view>

namespace mlcv::stats {

// ─── Configuration ────────────────────────────────────────────────────────────

/// Which samples enter C(0).
enum class C0Policy {
    Instantaneous, ///< C(0) from x_t weighted by w_t, centered on mean(x_t)
    Pooled,        ///< ½[cov(x_t, w_t) + cov(x_lag, w_lag)], pooled mean
};

[[nodiscard]] std::string_view to_string(C0Policy policy) noexcept;

/// Parse "instantaneous" / "pooled". Returns nullopt for anything else.
[[nodiscard]] std::optional<C0Policy> parse_c0_policy(std::string_view text) noexcept;

// ─── Results ──────────────────────────────────────────────────────────────────

/// Output of `CovarianceEstimator::estimate`.
struct CovarianceEstimate {
    Matrix    c0;    ///< Regularized instantaneous covariance, d×d, SPD
    Matrix    ctau;  ///< Symmetrized time-lagged covariance, d×d
    RowVector mean;  ///< Weighted mean used for centering, 1×d

    /// Fraction of the returned matrices contributed by the current batch
    /// (1 unless running-average mode blended in earlier batches).
    double batch_share = 1.0;
};

/// Loss gradients with respect to the estimator inputs.
struct FeatureGradient {
    Matrix x_t;    ///< dL/dx_t, same shape as x_t
    Matrix x_lag;  ///< dL/dx_lag, same shape as x_lag
};

/// Loss gradients with respect to the (symmetric) covariance matrices.
struct CovarianceGradient {
    Matrix c0;
    Matrix ctau;
};

// ─── CovarianceEstimator ──────────────────────────────────────────────────────

/// Estimates weighted instantaneous and time-lagged covariance matrices.
///
/// Stateless by default: every call depends only on its arguments. With a
/// running momentum m ∈ (0, 1) the estimator keeps exponential averages
///   C ← m · C_prev + (1 − m) · C_batch
/// of the unregularized matrices and the mean, and returns the blend.
///
/// # Example
/// ```cpp
/// mlcv::stats::CovarianceEstimator est;
/// auto cov = est.estimate(pair, 1e-6);
/// // cov.c0 is SPD, cov.ctau is symmetric
/// ```
class CovarianceEstimator {
public:
    /// # Arguments
    /// * `policy`           — How C(0) is assembled
    /// * `running_momentum` — 0 for stateless estimates, else in (0, 1)
    ///
    /// Throws `ConfigurationError` if running_momentum is outside [0, 1).
    explicit CovarianceEstimator(C0Policy policy = C0Policy::Instantaneous,
                                 double running_momentum = 0.0);

    /// Estimate (C0 + reg_c0·I, sym(Ctau)) from a time-lagged pair.
    ///
    /// # Errors
    /// - `ShapeMismatchError`        if the pair violates its shape invariants
    /// - `ConfigurationError`        if reg_c0 < 0
    /// - `NumericalInstabilityError` if inputs are non-finite or the
    ///                               regularized C0 is not positive definite
    [[nodiscard]] CovarianceEstimate estimate(const TimeLagPair& pair,
                                              double reg_c0);

    /// Propagate dL/dC0 and dL/dCtau back to the batch features.
    ///
    /// Includes the contribution through the weighted mean. `batch_share` is
    /// the value reported by the matching `estimate` call. The gradients are
    /// symmetrized before use.
    [[nodiscard]] FeatureGradient backward(const TimeLagPair& pair,
                                           const CovarianceGradient& grad,
                                           double batch_share = 1.0) const;

    /// Check the TimeLagPair invariants. Throws `ShapeMismatchError`.
    static void validate(const TimeLagPair& pair);

    [[nodiscard]] C0Policy policy() const noexcept { return policy_; }
    [[nodiscard]] bool is_running() const noexcept { return momentum_ > 0.0; }
    [[nodiscard]] double running_momentum() const noexcept { return momentum_; }

    /// Number of batches folded into the running averages.
    [[nodiscard]] std::size_t batches_seen() const noexcept { return batches_seen_; }

    /// Drop the running averages.
    void reset() noexcept;

private:
    C0Policy    policy_;
    double      momentum_;
    std::size_t batches_seen_ = 0;

    Matrix    running_c0_;    ///< Unregularized
    Matrix    running_ctau_;
    RowVector running_mean_;
};

// ─── GeneralizedEigenSolver ───────────────────────────────────────────────────

/// Solves C(τ) v = λ C(0) v for symmetric C(τ) and SPD C(0).
///
/// Method: Cholesky C(0) = L Lᵀ, symmetric eigen-decomposition of
/// L⁻¹ C(τ) L⁻ᵀ = U Λ Uᵀ, back-substitution V = L⁻ᵀ U. The columns of V
/// are C(0)-orthonormal: vᵢᵀ C(0) vⱼ = δᵢⱼ.
///
/// Ordering: eigenvalues strictly by value, descending. Equal values keep the
/// order in which the symmetric solver produced them. Each eigenvector is
/// sign-fixed so that its entry of largest magnitude is positive, making
/// repeated calls on identical input bit-identical.
///
/// Gradients: eigenvalue derivatives are exact first-order perturbation
/// results and always finite. Eigenvector derivatives divide by eigenvalue
/// gaps; gaps smaller than `constants::EIGENGAP_FLOOR` are floored, so
/// near-degenerate spectra give large but finite gradients.
class GeneralizedEigenSolver {
public:
    GeneralizedEigenSolver() = delete;

    /// Top-k eigenpairs.
    ///
    /// # Errors
    /// - `ShapeMismatchError`        if C0 and Ctau are not square of equal size
    /// - `ConfigurationError`        if k < 1 or k > d
    /// - `NumericalInstabilityError` if C0 is not positive definite or the
    ///                               symmetric eigen solve does not converge
    [[nodiscard]] static EigenDecomposition
    solve(const Matrix& c0, const Matrix& ctau, Eigen::Index k);

    /// All d eigenpairs, same ordering and sign convention as `solve`.
    [[nodiscard]] static EigenDecomposition
    solve_full(const Matrix& c0, const Matrix& ctau);

    /// Gradient of a loss depending on the top-k eigenvalues only.
    ///
    /// # Arguments
    /// * `full`             — Result of `solve_full` on the same matrices
    /// * `grad_eigenvalues` — dL/dλ for the first k eigenvalues (length k)
    [[nodiscard]] static CovarianceGradient
    backward(const EigenDecomposition& full, const Vector& grad_eigenvalues);

    /// Gradient of a loss depending on the top-k eigenvalues and eigenvectors.
    ///
    /// * `grad_eigenvectors` — dL/dV for the first k columns, shape (d, k)
    [[nodiscard]] static CovarianceGradient
    backward(const EigenDecomposition& full,
             const Vector& grad_eigenvalues,
             const Matrix& grad_eigenvectors);
};

// ─── Positive-definiteness check ──────────────────────────────────────────────

/// Cholesky factor of a C(0) that must be numerically positive definite.
///
/// `LLT::info()` only reports a pivot ≤ 0. An exactly singular C(0), such as
/// the covariance of two identical features, usually leaves a tiny positive
/// pivot from rounding instead. C(0) is therefore also rejected when its
/// smallest pivot L_ii² does not exceed
/// `constants::SINGULAR_PIVOT_ULPS` · d · ε · max_i C(0)_ii.
///
/// Throws `ShapeMismatchError` for a non-square C(0), and
/// `NumericalInstabilityError` naming the dimensions, the pivot and, when
/// given, the regularization that was already applied.
[[nodiscard]] Eigen::LLT<Matrix>
checked_cholesky(const Matrix& c0, std::optional<double> reg_c0 = std::nullopt);

} // namespace mlcv::stats
