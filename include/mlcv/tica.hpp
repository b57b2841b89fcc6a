#pragma once

/// @file include/mlcv/tica.hpp
/// @brief TicaEngine — covariance estimation, generalized eigensolve and the
///        cached output projection, as one pipeline block.
///
/// # Module: TICA Engine
///
/// ## Responsibility
/// `compute(pair, save_params)`:
///   1. C(0), C(τ) from the pair (CovarianceEstimator, engine's reg_c0)
///   2. all eigenpairs of C(τ) v = λ C(0) v (GeneralizedEigenSolver)
///   3. return the top `out_features` pairs; with save_params also cache
///      them for `project`
///
/// `project(x) = x · V` with V the cached (in_features × out_features)
/// eigenvectors. Before any saved computation V holds the first
/// `out_features` coordinate axes.
///
/// ## Gradients
/// Every `compute` records a tape (input pair and full decomposition).
/// `backward(dL/dλ)` turns it into dL/dx_t and dL/dx_lag.
///
/// ## NOT Responsible For
/// - Producing the features (see FeedForwardBlock)
/// - Choosing the eigenvalue reduction (see include/mlcv/loss.hpp)

#include "mlcv/blocks.hpp"
#include "mlcv/constants.hpp"
#include "mlcv/stats.hpp"

#include <optional>
#include <string_view>

namespace mlcv::tica {

struct TicaOptions {
    double          reg_c0           = constants::DEFAULT_REG_C0;
    stats::C0Policy c0_policy        = stats::C0Policy::Instantaneous;
    double          running_momentum = 0.0;  ///< 0 = fresh estimate per batch
};

class TicaEngine final : public blocks::Block {
public:
    /// Throws `ConfigurationError` unless 1 ≤ out_features ≤ in_features,
    /// or if the options hold a negative reg_c0 or a momentum outside [0, 1).
    TicaEngine(Eigen::Index in_features, Eigen::Index out_features,
               TicaOptions options = {});

    /// Solve TICA on one time-lagged feature batch.
    ///
    /// # Returns
    /// Top `out_features` eigenvalues (descending) and eigenvectors.
    ///
    /// # Errors
    /// Everything `CovarianceEstimator::estimate` and
    /// `GeneralizedEigenSolver::solve_full` throw.
    [[nodiscard]] EigenDecomposition compute(const TimeLagPair& pair,
                                             bool save_params = false);

    /// dL/d(features) for a loss on the eigenvalues of the last `compute`.
    /// `grad_eigenvalues` has length out_features.
    [[nodiscard]] stats::FeatureGradient backward(const Vector& grad_eigenvalues) const;

    /// As above, with an additional (in_features × out_features) dL/dV.
    [[nodiscard]] stats::FeatureGradient backward(const Vector& grad_eigenvalues,
                                                  const Matrix& grad_eigenvectors) const;

    /// x · V with the cached eigenvectors.
    [[nodiscard]] Matrix project(const Matrix& x) const;

    [[nodiscard]] Matrix forward(const Matrix& x) override { return project(x); }

    /// Set reg_c0 for subsequent computations. Throws `ConfigurationError`
    /// for negative or non-finite values.
    void set_regularization(double reg_c0);
    [[nodiscard]] double regularization() const noexcept { return options_.reg_c0; }

    /// True once a `compute(..., save_params = true)` succeeded.
    [[nodiscard]] bool has_params() const noexcept { return has_params_; }

    /// True once any `compute` succeeded, i.e. `backward` is usable.
    [[nodiscard]] bool has_tape() const noexcept { return tape_.has_value(); }

    [[nodiscard]] const Vector& eigenvalues() const noexcept { return eigenvalues_; }
    [[nodiscard]] const Matrix& eigenvectors() const noexcept { return eigenvectors_; }

    /// Centering mean of the last saved computation.
    [[nodiscard]] const RowVector& mean() const noexcept { return mean_; }

    [[nodiscard]] const TicaOptions& options() const noexcept { return options_; }
    [[nodiscard]] const stats::CovarianceEstimator& estimator() const noexcept { return estimator_; }

    [[nodiscard]] Eigen::Index in_features() const noexcept override { return in_features_; }
    [[nodiscard]] Eigen::Index out_features() const noexcept override { return out_features_; }
    [[nodiscard]] std::string_view kind() const noexcept override { return "tica"; }

private:
    struct Tape {
        TimeLagPair        pair;
        EigenDecomposition full;
        double             batch_share = 1.0;
    };

    Eigen::Index               in_features_;
    Eigen::Index               out_features_;
    TicaOptions                options_;
    stats::CovarianceEstimator estimator_;

    bool      has_params_ = false;
    Vector    eigenvalues_;
    Matrix    eigenvectors_;
    RowVector mean_;

    std::optional<Tape> tape_;
};

} // namespace mlcv::tica
