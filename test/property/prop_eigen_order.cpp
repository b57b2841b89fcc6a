/**
 * @file  prop_eigen_order.cpp
 * @brief Property: generalized eigenpairs are sorted and C(0)-orthonormal
 *
 * Run with 1,000 random problems:
 *   RC_PARAMS="max_success=1000" ./prop_eigen_order
 *
 * For C(0) = A Aᵀ + I and symmetric C(τ) of random size d ∈ [1, 8]:
 *   λ₁ ≥ λ₂ ≥ … ≥ λ_d
 *   Vᵀ C(0) V = I              to 1e-8
 *   C(τ) vᵢ = λᵢ C(0) vᵢ        to 1e-8 (relative)
 *   max |vᵢ| entry is positive
 */

#include <rapidcheck.h>
#include <cmath>
#include <random>

#include "mlcv/stats.hpp"

using namespace mlcv;
using namespace mlcv::stats;

namespace {

Matrix random_matrix(Eigen::Index rows, Eigen::Index cols, unsigned seed) {
    std::mt19937_64 rng(seed);
    std::normal_distribution<double> dist(0.0, 1.0);
    Matrix m(rows, cols);
    for (Eigen::Index i = 0; i < rows; ++i) {
        for (Eigen::Index j = 0; j < cols; ++j) {
            m(i, j) = dist(rng);
        }
    }
    return m;
}

} // anonymous namespace

int main() {
    // ── Property 1: ordering, orthonormality, residual ───────────────────────
    rc::check(
        "eigen_order: eigenvalues descending and eigenvectors C0-orthonormal",
        []() {
            const auto d    = *rc::gen::inRange<Eigen::Index>(1, 9);
            const auto seed = *rc::gen::arbitrary<unsigned>();

            const Matrix a    = random_matrix(d, d, seed);
            const Matrix b    = random_matrix(d, d, seed + 1);
            const Matrix c0   = a * a.transpose() + Matrix::Identity(d, d);
            const Matrix ctau = 0.5 * (b + b.transpose());

            const auto eig = GeneralizedEigenSolver::solve_full(c0, ctau);
            RC_ASSERT(eig.eigenvalues.size() == d);

            for (Eigen::Index i = 1; i < d; ++i) {
                RC_ASSERT(eig.eigenvalues(i - 1) >= eig.eigenvalues(i));
            }

            const Matrix gram = eig.eigenvectors.transpose() * c0 * eig.eigenvectors;
            RC_ASSERT((gram - Matrix::Identity(d, d)).cwiseAbs().maxCoeff() < 1e-8);

            for (Eigen::Index i = 0; i < d; ++i) {
                const auto v = eig.eigenvectors.col(i);
                const Vector residual = ctau * v - eig.eigenvalues(i) * (c0 * v);
                RC_ASSERT(residual.norm() < 1e-8 * (1.0 + ctau.norm() + c0.norm()));

                Eigen::Index arg = 0;
                v.cwiseAbs().maxCoeff(&arg);
                RC_ASSERT(v(arg) > 0.0);
            }
        }
    );

    // ── Property 2: top-k is the prefix of the full solve ────────────────────
    rc::check(
        "eigen_order: solve(k) equals the first k pairs of solve_full",
        []() {
            const auto d    = *rc::gen::inRange<Eigen::Index>(1, 7);
            const auto k    = *rc::gen::inRange<Eigen::Index>(1, d + 1);
            const auto seed = *rc::gen::arbitrary<unsigned>();

            const Matrix a    = random_matrix(d, d, seed);
            const Matrix b    = random_matrix(d, d, seed + 7);
            const Matrix c0   = a * a.transpose() + Matrix::Identity(d, d);
            const Matrix ctau = 0.5 * (b + b.transpose());

            const auto full = GeneralizedEigenSolver::solve_full(c0, ctau);
            const auto top  = GeneralizedEigenSolver::solve(c0, ctau, k);
            RC_ASSERT(top.eigenvalues == full.eigenvalues.head(k));
            RC_ASSERT(top.eigenvectors == full.eigenvectors.leftCols(k));
        }
    );

    return 0;
}
