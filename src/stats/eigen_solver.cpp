/// @file src/stats/eigen_solver.cpp
/// @brief Generalized symmetric eigenproblem C(τ) v = λ C(0) v and its gradient.

#include "mlcv/stats.hpp"
#include "mlcv/constants.hpp"
#include "mlcv/errors.hpp"

#include <Eigen/Cholesky>
#include <Eigen/Eigenvalues>
#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <string>
#include <vector>

namespace mlcv::stats {

// ─── Internal helpers ─────────────────────────────────────────────────────────

namespace {

void check_square_pair(const Matrix& c0, const Matrix& ctau) {
    if (c0.rows() == 0 || c0.rows() != c0.cols()) {
        throw ShapeMismatchError(fmt::format(
            "C0 must be square and non-empty, got {}x{}", c0.rows(), c0.cols()));
    }
    if (ctau.rows() != c0.rows() || ctau.cols() != c0.cols()) {
        throw ShapeMismatchError(fmt::format(
            "Ctau is {}x{} but C0 is {}x{}",
            ctau.rows(), ctau.cols(), c0.rows(), c0.cols()));
    }
}

/// Flip v so that its largest-magnitude entry (first one on ties) is positive.
void fix_sign(Eigen::Ref<Eigen::VectorXd> v) {
    Eigen::Index arg = 0;
    v.cwiseAbs().maxCoeff(&arg);
    if (v(arg) < 0.0) {
        v = -v;
    }
}

[[nodiscard]] double floored_gap(double gap) noexcept {
    if (std::abs(gap) >= constants::EIGENGAP_FLOOR) {
        return gap;
    }
    return gap < 0.0 ? -constants::EIGENGAP_FLOOR : constants::EIGENGAP_FLOOR;
}

[[nodiscard]] std::string regularization_note(std::optional<double> reg_c0) {
    if (!reg_c0) {
        return std::string();
    }
    return fmt::format(" after adding reg_c0 = {:g}; increase the regularization", *reg_c0);
}

} // anonymous namespace

// ─── checked_cholesky ─────────────────────────────────────────────────────────

Eigen::LLT<Matrix> checked_cholesky(const Matrix& c0, std::optional<double> reg_c0) {
    if (c0.rows() == 0 || c0.rows() != c0.cols()) {
        throw ShapeMismatchError(fmt::format(
            "C0 must be square and non-empty, got {}x{}", c0.rows(), c0.cols()));
    }
    const Eigen::Index d = c0.rows();
    if (!c0.allFinite()) {
        throw NumericalInstabilityError(fmt::format(
            "C0 ({}x{}) contains non-finite entries", d, d));
    }

    Eigen::LLT<Matrix> llt(c0);
    if (llt.info() != Eigen::Success) {
        throw NumericalInstabilityError(fmt::format(
            "C0 ({}x{}) is not positive definite{}; Cholesky factorization failed",
            d, d, regularization_note(reg_c0)));
    }

    const Matrix l = llt.matrixL();
    const double min_pivot = l.diagonal().cwiseAbs2().minCoeff();
    const double scale     = c0.diagonal().cwiseAbs().maxCoeff();
    const double tolerance = constants::SINGULAR_PIVOT_ULPS * static_cast<double>(d) *
                             std::numeric_limits<double>::epsilon() * scale;
    if (!(min_pivot > tolerance)) {
        throw NumericalInstabilityError(fmt::format(
            "C0 ({}x{}) is numerically singular{}: smallest Cholesky pivot {:.3e} "
            "is below {:.3e}", d, d, regularization_note(reg_c0), min_pivot, tolerance));
    }
    return llt;
}

// ─── solve_full ───────────────────────────────────────────────────────────────

EigenDecomposition GeneralizedEigenSolver::solve_full(const Matrix& c0,
                                                      const Matrix& ctau) {
    check_square_pair(c0, ctau);
    const Eigen::Index d = c0.rows();

    if (!c0.allFinite() || !ctau.allFinite()) {
        throw NumericalInstabilityError(fmt::format(
            "C0 or Ctau ({}x{}) contains non-finite entries", d, d));
    }

    const Eigen::LLT<Matrix> llt = checked_cholesky(c0);
    const Matrix l = llt.matrixL();
    const auto lower = l.triangularView<Eigen::Lower>();

    // Ã = L⁻¹ C(τ) L⁻ᵀ, computed as (L⁻¹ (L⁻¹ C(τ))ᵀ)ᵀ.
    const Matrix half    = lower.solve(ctau);
    const Matrix reduced_t = lower.solve(half.transpose());
    const Matrix reduced = 0.5 * (reduced_t + reduced_t.transpose());

    Eigen::SelfAdjointEigenSolver<Matrix> eig(reduced);
    if (eig.info() != Eigen::Success) {
        throw NumericalInstabilityError(fmt::format(
            "symmetric eigen solve on the whitened {}x{} Ctau did not converge", d, d));
    }

    // V = L⁻ᵀ U
    const Matrix vectors = l.transpose().triangularView<Eigen::Upper>()
                               .solve(eig.eigenvectors());
    const Vector& values = eig.eigenvalues();
    if (!values.allFinite() || !vectors.allFinite()) {
        throw NumericalInstabilityError(fmt::format(
            "generalized eigenpairs of the {}x{} problem are not finite", d, d));
    }

    std::vector<Eigen::Index> order(static_cast<std::size_t>(d));
    std::iota(order.begin(), order.end(), Eigen::Index{0});
    std::stable_sort(order.begin(), order.end(),
                     [&values](Eigen::Index lhs, Eigen::Index rhs) {
                         return values(lhs) > values(rhs);
                     });

    EigenDecomposition out{
        .eigenvalues  = Vector(d),
        .eigenvectors = Matrix(d, d),
    };
    for (Eigen::Index i = 0; i < d; ++i) {
        const Eigen::Index src = order[static_cast<std::size_t>(i)];
        out.eigenvalues(i)     = values(src);
        out.eigenvectors.col(i) = vectors.col(src);
        fix_sign(out.eigenvectors.col(i));
    }
    return out;
}

// ─── solve ────────────────────────────────────────────────────────────────────

EigenDecomposition GeneralizedEigenSolver::solve(const Matrix& c0,
                                                 const Matrix& ctau,
                                                 Eigen::Index k) {
    check_square_pair(c0, ctau);
    const Eigen::Index d = c0.rows();
    if (k < 1 || k > d) {
        throw ConfigurationError(fmt::format(
            "requested {} eigenpairs from a {}x{} problem; need 1 <= k <= {}",
            k, d, d, d));
    }

    EigenDecomposition full = solve_full(c0, ctau);
    return EigenDecomposition{
        .eigenvalues  = full.eigenvalues.head(k),
        .eigenvectors = full.eigenvectors.leftCols(k),
    };
}

// ─── backward ─────────────────────────────────────────────────────────────────

CovarianceGradient GeneralizedEigenSolver::backward(const EigenDecomposition& full,
                                                    const Vector& grad_eigenvalues) {
    const Eigen::Index d = full.eigenvalues.size();
    const Eigen::Index k = grad_eigenvalues.size();
    if (k > d || full.eigenvectors.rows() != d || full.eigenvectors.cols() != d) {
        throw ShapeMismatchError(fmt::format(
            "eigenvalue gradient has {} entries for a full decomposition of "
            "{} values and {}x{} vectors",
            k, d, full.eigenvectors.rows(), full.eigenvectors.cols()));
    }

    // dλᵢ = vᵢᵀ (dC(τ) − λᵢ dC(0)) vᵢ
    CovarianceGradient out{
        .c0   = Matrix::Zero(d, d),
        .ctau = Matrix::Zero(d, d),
    };
    for (Eigen::Index i = 0; i < k; ++i) {
        const auto v = full.eigenvectors.col(i);
        const Matrix outer = v * v.transpose();
        out.ctau += grad_eigenvalues(i) * outer;
        out.c0   -= grad_eigenvalues(i) * full.eigenvalues(i) * outer;
    }
    return out;
}

CovarianceGradient GeneralizedEigenSolver::backward(const EigenDecomposition& full,
                                                    const Vector& grad_eigenvalues,
                                                    const Matrix& grad_eigenvectors) {
    CovarianceGradient out = backward(full, grad_eigenvalues);

    const Eigen::Index d = full.eigenvalues.size();
    const Eigen::Index k = grad_eigenvalues.size();
    if (grad_eigenvectors.rows() != d || grad_eigenvectors.cols() != k) {
        throw ShapeMismatchError(fmt::format(
            "eigenvector gradient is {}x{}, expected {}x{}",
            grad_eigenvectors.rows(), grad_eigenvectors.cols(), d, k));
    }

    // dvᵢ = Σ_{j≠i} vⱼ vⱼᵀ(dC(τ) − λᵢ dC(0)) vᵢ / (λᵢ − λⱼ) − ½ vᵢ vᵢᵀ dC(0) vᵢ
    Matrix ga = Matrix::Zero(d, d);
    Matrix gb = Matrix::Zero(d, d);
    for (Eigen::Index i = 0; i < k; ++i) {
        const auto vi = full.eigenvectors.col(i);
        const auto gi = grad_eigenvectors.col(i);
        const double lambda_i = full.eigenvalues(i);
        for (Eigen::Index j = 0; j < d; ++j) {
            if (j == i) {
                continue;
            }
            const auto vj = full.eigenvectors.col(j);
            const double coeff = gi.dot(vj) / floored_gap(lambda_i - full.eigenvalues(j));
            const Matrix outer = vj * vi.transpose();
            ga += coeff * outer;
            gb -= coeff * lambda_i * outer;
        }
        gb -= 0.5 * gi.dot(vi) * (vi * vi.transpose());
    }

    out.ctau += 0.5 * (ga + ga.transpose());
    out.c0   += 0.5 * (gb + gb.transpose());
    return out;
}

} // namespace mlcv::stats
