/// @file src/stats/covariance_estimator.cpp
/// @brief Weighted time-lagged covariance estimation and its gradient.

#include "mlcv/stats.hpp"
#include "mlcv/errors.hpp"

#include <fmt/core.h>

#include <cmath>
#include <utility>

namespace mlcv::stats {

// ─── Internal helpers ─────────────────────────────────────────────────────────

namespace {

/// Reject negative or non-finite weights and weight vectors with no mass.
void check_weights(const Vector& w, std::string_view name) {
    for (Eigen::Index i = 0; i < w.size(); ++i) {
        if (!std::isfinite(w(i)) || w(i) < 0.0) {
            throw ShapeMismatchError(fmt::format(
                "{}: weight {} at row {} must be finite and nonnegative",
                name, w(i), i));
        }
    }
    const double total = w.sum();
    if (!(total > 0.0)) {
        throw ShapeMismatchError(fmt::format(
            "{}: weights sum to {} over {} rows, expected a positive sum",
            name, total, w.size()));
    }
}

/// Centering mean for the given policy.
[[nodiscard]] RowVector centering_mean(const TimeLagPair& pair, C0Policy policy) {
    if (policy == C0Policy::Pooled) {
        const double total = pair.w_t.sum() + pair.w_lag.sum();
        return (pair.w_t.transpose() * pair.x_t +
                pair.w_lag.transpose() * pair.x_lag) / total;
    }
    return (pair.w_t.transpose() * pair.x_t) / pair.w_t.sum();
}

/// Σᵢ wᵢ aᵢ bᵢᵀ / Σᵢ wᵢ for row batches a, b (already centered).
[[nodiscard]] Matrix weighted_cross(const Matrix& a, const Matrix& b, const Vector& w) {
    return (a.transpose() * w.asDiagonal() * b) / w.sum();
}

[[nodiscard]] Matrix symmetrized(const Matrix& m) {
    return 0.5 * (m + m.transpose());
}

} // anonymous namespace

// ─── C0Policy ─────────────────────────────────────────────────────────────────

std::string_view to_string(C0Policy policy) noexcept {
    switch (policy) {
        case C0Policy::Instantaneous: return "instantaneous";
        case C0Policy::Pooled:        return "pooled";
    }
    return "instantaneous";
}

std::optional<C0Policy> parse_c0_policy(std::string_view text) noexcept {
    if (text == "instantaneous") return C0Policy::Instantaneous;
    if (text == "pooled")        return C0Policy::Pooled;
    return std::nullopt;
}

// ─── Construction ─────────────────────────────────────────────────────────────

CovarianceEstimator::CovarianceEstimator(C0Policy policy, double running_momentum)
    : policy_(policy), momentum_(running_momentum) {
    if (!std::isfinite(running_momentum) || running_momentum < 0.0 ||
        running_momentum >= 1.0) {
        throw ConfigurationError(fmt::format(
            "running_momentum must lie in [0, 1), got {}", running_momentum));
    }
}

// ─── validate ─────────────────────────────────────────────────────────────────

void CovarianceEstimator::validate(const TimeLagPair& pair) {
    if (pair.x_t.cols() == 0 || pair.x_t.rows() == 0) {
        throw ShapeMismatchError(fmt::format(
            "x_t is empty ({}x{})", pair.x_t.rows(), pair.x_t.cols()));
    }
    if (pair.x_t.cols() != pair.x_lag.cols()) {
        throw ShapeMismatchError(fmt::format(
            "feature width mismatch: x_t has {} columns, x_lag has {}",
            pair.x_t.cols(), pair.x_lag.cols()));
    }
    if (pair.x_t.rows() != pair.x_lag.rows()) {
        throw ShapeMismatchError(fmt::format(
            "batch mismatch: x_t has {} rows, x_lag has {} (rows are paired)",
            pair.x_t.rows(), pair.x_lag.rows()));
    }
    if (pair.w_t.size() != pair.x_t.rows()) {
        throw ShapeMismatchError(fmt::format(
            "w_t has {} entries but x_t has {} rows",
            pair.w_t.size(), pair.x_t.rows()));
    }
    if (pair.w_lag.size() != pair.x_lag.rows()) {
        throw ShapeMismatchError(fmt::format(
            "w_lag has {} entries but x_lag has {} rows",
            pair.w_lag.size(), pair.x_lag.rows()));
    }
    check_weights(pair.w_t, "w_t");
    check_weights(pair.w_lag, "w_lag");
}

// ─── estimate ─────────────────────────────────────────────────────────────────

CovarianceEstimate CovarianceEstimator::estimate(const TimeLagPair& pair,
                                                 double reg_c0) {
    validate(pair);
    if (!std::isfinite(reg_c0) || reg_c0 < 0.0) {
        throw ConfigurationError(fmt::format(
            "reg_c0 must be finite and >= 0, got {}", reg_c0));
    }
    if (!pair.x_t.allFinite() || !pair.x_lag.allFinite()) {
        throw NumericalInstabilityError(fmt::format(
            "non-finite features in time-lagged batch ({} rows x {} features)",
            pair.x_t.rows(), pair.x_t.cols()));
    }

    const Eigen::Index d = pair.x_t.cols();
    RowVector mean = centering_mean(pair, policy_);
    const Matrix a = pair.x_t.rowwise() - mean;
    const Matrix b = pair.x_lag.rowwise() - mean;

    Matrix c0 = weighted_cross(a, a, pair.w_t);
    if (policy_ == C0Policy::Pooled) {
        c0 = 0.5 * (c0 + weighted_cross(b, b, pair.w_lag));
    }
    c0 = symmetrized(c0);
    Matrix ctau = symmetrized(weighted_cross(a, b, pair.w_lag));

    double share = 1.0;
    if (is_running() && batches_seen_ > 0) {
        if (running_c0_.rows() != d) {
            throw ShapeMismatchError(fmt::format(
                "running covariance is {}x{} but the batch has {} features",
                running_c0_.rows(), running_c0_.cols(), d));
        }
        c0   = momentum_ * running_c0_   + (1.0 - momentum_) * c0;
        ctau = momentum_ * running_ctau_ + (1.0 - momentum_) * ctau;
        mean = momentum_ * running_mean_ + (1.0 - momentum_) * mean;
        share = 1.0 - momentum_;
    }

    Matrix c0_reg = c0;
    c0_reg.diagonal().array() += reg_c0;

    if (!c0_reg.allFinite() || !ctau.allFinite()) {
        throw NumericalInstabilityError(fmt::format(
            "covariance estimate ({}x{}) contains non-finite entries", d, d));
    }
    static_cast<void>(checked_cholesky(c0_reg, reg_c0));

    // The running state only takes batches whose estimate succeeded.
    if (is_running()) {
        running_c0_   = std::move(c0);
        running_ctau_ = ctau;
        running_mean_ = mean;
        ++batches_seen_;
    }

    return CovarianceEstimate{
        .c0          = std::move(c0_reg),
        .ctau        = std::move(ctau),
        .mean        = std::move(mean),
        .batch_share = share,
    };
}

// ─── backward ─────────────────────────────────────────────────────────────────

FeatureGradient CovarianceEstimator::backward(const TimeLagPair& pair,
                                              const CovarianceGradient& grad,
                                              double batch_share) const {
    validate(pair);
    const Eigen::Index d = pair.x_t.cols();
    if (grad.c0.rows() != d || grad.c0.cols() != d ||
        grad.ctau.rows() != d || grad.ctau.cols() != d) {
        throw ShapeMismatchError(fmt::format(
            "covariance gradients are {}x{} and {}x{}, expected {}x{}",
            grad.c0.rows(), grad.c0.cols(), grad.ctau.rows(), grad.ctau.cols(),
            d, d));
    }

    const Matrix g0 = batch_share * symmetrized(grad.c0);
    const Matrix gt = batch_share * symmetrized(grad.ctau);

    const RowVector mean = centering_mean(pair, policy_);
    const Matrix a = pair.x_t.rowwise() - mean;
    const Matrix b = pair.x_lag.rowwise() - mean;
    const double w_sum   = pair.w_t.sum();
    const double lag_sum = pair.w_lag.sum();

    // Gradients with respect to the centered rows a = x_t − μ, b = x_lag − μ.
    Matrix ga;
    Matrix gb;
    if (policy_ == C0Policy::Pooled) {
        ga = (pair.w_t.asDiagonal() * a * g0) / w_sum;
        gb = (pair.w_lag.asDiagonal() * b * g0) / lag_sum;
    } else {
        ga = (2.0 / w_sum) * (pair.w_t.asDiagonal() * a * g0);
        gb = Matrix::Zero(b.rows(), d);
    }
    ga += (pair.w_lag.asDiagonal() * b * gt) / lag_sum;
    gb += (pair.w_lag.asDiagonal() * a * gt) / lag_sum;

    // Every centered row depends on μ with coefficient −1.
    const RowVector through_mean = ga.colwise().sum() + gb.colwise().sum();

    FeatureGradient out{.x_t = std::move(ga), .x_lag = std::move(gb)};
    if (policy_ == C0Policy::Pooled) {
        const double total = w_sum + lag_sum;
        out.x_t   -= (pair.w_t / total) * through_mean;
        out.x_lag -= (pair.w_lag / total) * through_mean;
    } else {
        out.x_t   -= (pair.w_t / w_sum) * through_mean;
    }
    return out;
}

// ─── reset ────────────────────────────────────────────────────────────────────

void CovarianceEstimator::reset() noexcept {
    batches_seen_ = 0;
    running_c0_.resize(0, 0);
    running_ctau_.resize(0, 0);
    running_mean_.resize(0);
}

} // namespace mlcv::stats
