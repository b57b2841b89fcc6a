/// @file src/tica/tica_engine.cpp
/// @brief TicaEngine — estimator, eigensolver and cached projection.

#include "mlcv/tica.hpp"
#include "mlcv/errors.hpp"
#include "mlcv/log.hpp"

#include <fmt/core.h>

#include <cmath>

namespace mlcv::tica {

// ─── Constructor ──────────────────────────────────────────────────────────────

TicaEngine::TicaEngine(Eigen::Index in_features, Eigen::Index out_features,
                       TicaOptions options)
    : in_features_(in_features),
      out_features_(out_features),
      options_(options),
      estimator_(options.c0_policy, options.running_momentum) {
    if (in_features < 1) {
        throw ConfigurationError(fmt::format(
            "TICA needs at least 1 input feature, got {}", in_features));
    }
    if (out_features < 1 || out_features > in_features) {
        throw ConfigurationError(fmt::format(
            "TICA out_features = {} must lie in [1, {}] (its input features)",
            out_features, in_features));
    }
    set_regularization(options.reg_c0);

    eigenvalues_  = Vector::Zero(out_features);
    eigenvectors_ = Matrix::Identity(in_features, out_features);
    mean_         = RowVector::Zero(in_features);
}

// ─── compute ──────────────────────────────────────────────────────────────────

EigenDecomposition TicaEngine::compute(const TimeLagPair& pair, bool save_params) {
    if (pair.x_t.cols() != in_features_ || pair.x_lag.cols() != in_features_) {
        throw ShapeMismatchError(fmt::format(
            "TICA expects {} features, got x_t {}x{} and x_lag {}x{}",
            in_features_, pair.x_t.rows(), pair.x_t.cols(),
            pair.x_lag.rows(), pair.x_lag.cols()));
    }

    const stats::CovarianceEstimate cov = estimator_.estimate(pair, options_.reg_c0);
    EigenDecomposition full = stats::GeneralizedEigenSolver::solve_full(cov.c0, cov.ctau);

    EigenDecomposition top{
        .eigenvalues  = full.eigenvalues.head(out_features_),
        .eigenvectors = full.eigenvectors.leftCols(out_features_),
    };
    log::debug("tica: {} samples, leading eigenvalue {:.6f}",
               pair.x_t.rows(), top.eigenvalues(0));

    if (save_params) {
        eigenvalues_  = top.eigenvalues;
        eigenvectors_ = top.eigenvectors;
        mean_         = cov.mean;
        has_params_   = true;
    }

    tape_ = Tape{
        .pair        = pair,
        .full        = std::move(full),
        .batch_share = cov.batch_share,
    };
    return top;
}

// ─── backward ─────────────────────────────────────────────────────────────────

stats::FeatureGradient TicaEngine::backward(const Vector& grad_eigenvalues) const {
    return backward(grad_eigenvalues, Matrix::Zero(in_features_, out_features_));
}

stats::FeatureGradient TicaEngine::backward(const Vector& grad_eigenvalues,
                                            const Matrix& grad_eigenvectors) const {
    if (!tape_) {
        throw Error("TICA backward called before any compute");
    }
    if (grad_eigenvalues.size() != out_features_) {
        throw ShapeMismatchError(fmt::format(
            "eigenvalue gradient has {} entries, expected {}",
            grad_eigenvalues.size(), out_features_));
    }

    const stats::CovarianceGradient cov_grad = grad_eigenvectors.isZero(0.0)
        ? stats::GeneralizedEigenSolver::backward(tape_->full, grad_eigenvalues)
        : stats::GeneralizedEigenSolver::backward(tape_->full, grad_eigenvalues,
                                                  grad_eigenvectors);
    return estimator_.backward(tape_->pair, cov_grad, tape_->batch_share);
}

// ─── project ──────────────────────────────────────────────────────────────────

Matrix TicaEngine::project(const Matrix& x) const {
    check_input(x);
    return x * eigenvectors_;
}

// ─── set_regularization ───────────────────────────────────────────────────────

void TicaEngine::set_regularization(double reg_c0) {
    if (!std::isfinite(reg_c0) || reg_c0 < 0.0) {
        throw ConfigurationError(fmt::format(
            "reg_c0 must be finite and >= 0, got {}", reg_c0));
    }
    options_.reg_c0 = reg_c0;
}

} // namespace mlcv::tica
