/// @file tests/stats/test_eigen_solver.cpp
/// @brief Unit tests for GeneralizedEigenSolver.
///
/// Test categories:
///   - Residual, ordering and C0-orthonormality of the eigenpairs
///   - Sign convention and determinism
///   - Top-k selection and its errors
///   - Eigenvalue / eigenvector gradients against finite differences
///   - Near-degenerate spectra give finite gradients

#include <gtest/gtest.h>
#include "mlcv/errors.hpp"
#include "mlcv/stats.hpp"

#include <limits>
#include <random>
#include <string>

using namespace mlcv;
using namespace mlcv::stats;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static Matrix random_matrix(Eigen::Index rows, Eigen::Index cols, unsigned seed) {
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

/// Well-conditioned SPD matrix.
static Matrix random_spd(Eigen::Index d, unsigned seed) {
    const Matrix a = random_matrix(d, d, seed);
    return a * a.transpose() + Matrix::Identity(d, d);
}

static Matrix random_symmetric(Eigen::Index d, unsigned seed) {
    const Matrix a = random_matrix(d, d, seed);
    return 0.5 * (a + a.transpose());
}

/// Apply a symmetric perturbation of size h at (a, b).
static Matrix bump(const Matrix& m, Eigen::Index a, Eigen::Index b, double h) {
    Matrix out = m;
    out(a, b) += h;
    if (a != b) {
        out(b, a) += h;
    }
    return out;
}

// ─── Eigenpairs ──────────────────────────────────────────────────────────────

TEST(GeneralizedEigenSolver, SolvesTheGeneralizedProblem) {
    const Matrix c0   = random_spd(4, 1);
    const Matrix ctau = random_symmetric(4, 2);
    const auto eig = GeneralizedEigenSolver::solve_full(c0, ctau);

    ASSERT_EQ(eig.eigenvalues.size(), 4);
    for (Eigen::Index i = 0; i < 4; ++i) {
        const auto v = eig.eigenvectors.col(i);
        const Vector residual = ctau * v - eig.eigenvalues(i) * (c0 * v);
        EXPECT_LT(residual.norm(), 1e-10);
    }
}

TEST(GeneralizedEigenSolver, EigenvaluesDescending) {
    const auto eig = GeneralizedEigenSolver::solve_full(random_spd(6, 3), random_symmetric(6, 4));
    for (Eigen::Index i = 1; i < eig.eigenvalues.size(); ++i) {
        EXPECT_GE(eig.eigenvalues(i - 1), eig.eigenvalues(i));
    }
}

TEST(GeneralizedEigenSolver, EigenvectorsAreC0Orthonormal) {
    const Matrix c0 = random_spd(5, 5);
    const auto eig = GeneralizedEigenSolver::solve_full(c0, random_symmetric(5, 6));
    const Matrix gram = eig.eigenvectors.transpose() * c0 * eig.eigenvectors;
    EXPECT_TRUE(gram.isApprox(Matrix::Identity(5, 5), 1e-10));
}

TEST(GeneralizedEigenSolver, DiagonalProblemKnownValues) {
    const Matrix c0 = Matrix::Identity(3, 3);
    Matrix ctau = Matrix::Zero(3, 3);
    ctau.diagonal() << 0.2, 0.9, 0.5;
    const auto eig = GeneralizedEigenSolver::solve_full(c0, ctau);
    EXPECT_NEAR(eig.eigenvalues(0), 0.9, 1e-14);
    EXPECT_NEAR(eig.eigenvalues(1), 0.5, 1e-14);
    EXPECT_NEAR(eig.eigenvalues(2), 0.2, 1e-14);
    EXPECT_NEAR(eig.eigenvectors(1, 0), 1.0, 1e-14);
}

TEST(GeneralizedEigenSolver, LargestEntryOfEachEigenvectorIsPositive) {
    const auto eig = GeneralizedEigenSolver::solve_full(random_spd(5, 7), random_symmetric(5, 8));
    for (Eigen::Index i = 0; i < 5; ++i) {
        Eigen::Index arg = 0;
        eig.eigenvectors.col(i).cwiseAbs().maxCoeff(&arg);
        EXPECT_GT(eig.eigenvectors(arg, i), 0.0);
    }
}

TEST(GeneralizedEigenSolver, DeterministicForIdenticalInput) {
    const Matrix c0   = random_spd(4, 9);
    const Matrix ctau = random_symmetric(4, 10);
    const auto a = GeneralizedEigenSolver::solve_full(c0, ctau);
    const auto b = GeneralizedEigenSolver::solve_full(c0, ctau);
    EXPECT_TRUE(a.eigenvalues == b.eigenvalues);
    EXPECT_TRUE(a.eigenvectors == b.eigenvectors);
}

TEST(GeneralizedEigenSolver, TopKMatchesFullPrefix) {
    const Matrix c0   = random_spd(5, 11);
    const Matrix ctau = random_symmetric(5, 12);
    const auto full = GeneralizedEigenSolver::solve_full(c0, ctau);
    const auto top  = GeneralizedEigenSolver::solve(c0, ctau, 2);
    ASSERT_EQ(top.eigenvalues.size(), 2);
    ASSERT_EQ(top.eigenvectors.cols(), 2);
    EXPECT_TRUE(top.eigenvalues == full.eigenvalues.head(2));
    EXPECT_TRUE(top.eigenvectors == full.eigenvectors.leftCols(2));
}

// ─── Errors ──────────────────────────────────────────────────────────────────

TEST(GeneralizedEigenSolver, RejectsBadK) {
    const Matrix c0 = random_spd(3, 13);
    const Matrix ctau = random_symmetric(3, 14);
    EXPECT_THROW(static_cast<void>(GeneralizedEigenSolver::solve(c0, ctau, 4)), ConfigurationError);
    EXPECT_THROW(static_cast<void>(GeneralizedEigenSolver::solve(c0, ctau, 0)), ConfigurationError);
}

TEST(GeneralizedEigenSolver, RejectsShapeMismatch) {
    EXPECT_THROW(static_cast<void>(GeneralizedEigenSolver::solve_full(
                     random_spd(3, 1), random_symmetric(4, 2))),
                 ShapeMismatchError);
    EXPECT_THROW(static_cast<void>(GeneralizedEigenSolver::solve_full(
                     Matrix::Ones(2, 3), Matrix::Ones(2, 3))),
                 ShapeMismatchError);
}

TEST(GeneralizedEigenSolver, RejectsIndefiniteC0) {
    Matrix c0 = Matrix::Identity(3, 3);
    c0(2, 2) = -1.0;
    EXPECT_THROW(static_cast<void>(GeneralizedEigenSolver::solve_full(c0, random_symmetric(3, 3))),
                 NumericalInstabilityError);
}

TEST(GeneralizedEigenSolver, RejectsSingularC0WithPositivePivots) {
    // Covariance of two identical features. Rounding leaves the second
    // Cholesky pivot slightly positive, so the factorization itself succeeds.
    const Matrix c0 = Matrix::Constant(2, 2, 2.4974987232850738);
    Matrix ctau(2, 2);
    ctau << 1.9, 1.9,
            1.9, 1.9;
    EXPECT_THROW(static_cast<void>(GeneralizedEigenSolver::solve_full(c0, ctau)),
                 NumericalInstabilityError);
    EXPECT_THROW(static_cast<void>(checked_cholesky(c0)), NumericalInstabilityError);
}

TEST(GeneralizedEigenSolver, RejectsExactlyRankDeficientC0) {
    Vector u(3);
    Vector v(3);
    u << 1.0, 2.0, 3.0;
    v << 0.0, 1.0, 1.0;
    const Matrix c0 = u * u.transpose() + v * v.transpose();
    EXPECT_THROW(static_cast<void>(GeneralizedEigenSolver::solve_full(c0, random_symmetric(3, 6))),
                 NumericalInstabilityError);
}

TEST(CheckedCholesky, FactorsWellConditionedMatrix) {
    const Matrix c0 = random_spd(4, 17);
    const Eigen::LLT<Matrix> llt = checked_cholesky(c0, 1e-6);
    const Matrix l = llt.matrixL();
    EXPECT_TRUE((l * l.transpose()).isApprox(c0, 1e-12));
}

TEST(CheckedCholesky, ErrorNamesDimensionsAndRegularization) {
    try {
        static_cast<void>(checked_cholesky(Matrix::Constant(2, 2, 2.4974987232850738), 0.0));
        FAIL() << "a singular C0 must be rejected";
    } catch (const NumericalInstabilityError& e) {
        const std::string what = e.what();
        EXPECT_NE(what.find("2x2"), std::string::npos) << what;
        EXPECT_NE(what.find("reg_c0 = 0"), std::string::npos) << what;
    }
}

TEST(CheckedCholesky, RejectsNonSquareInput) {
    EXPECT_THROW(static_cast<void>(checked_cholesky(Matrix::Ones(2, 3))), ShapeMismatchError);
}

TEST(GeneralizedEigenSolver, RejectsNonFiniteInput) {
    Matrix ctau = random_symmetric(3, 4);
    ctau(0, 1) = std::numeric_limits<double>::infinity();
    EXPECT_THROW(static_cast<void>(GeneralizedEigenSolver::solve_full(random_spd(3, 5), ctau)),
                 NumericalInstabilityError);
}

// ─── Gradients ───────────────────────────────────────────────────────────────

TEST(GeneralizedEigenSolver, EigenvalueGradientMatchesFiniteDifferences) {
    const Eigen::Index d = 4;
    const Matrix c0   = random_spd(d, 21);
    const Matrix ctau = random_symmetric(d, 22);
    Vector g(2);
    g << 1.0, -0.5;

    auto loss = [&](const Matrix& a, const Matrix& b) {
        return GeneralizedEigenSolver::solve(a, b, 2).eigenvalues.dot(g);
    };

    const auto full = GeneralizedEigenSolver::solve_full(c0, ctau);
    const auto grad = GeneralizedEigenSolver::backward(full, g);

    const double h = 1e-6;
    for (Eigen::Index a = 0; a < d; ++a) {
        for (Eigen::Index b = a; b < d; ++b) {
            const double scale = (a == b) ? 1.0 : 2.0;
            const double fd_tau = (loss(c0, bump(ctau, a, b, h)) - loss(c0, bump(ctau, a, b, -h)))
                                / (2.0 * h);
            EXPECT_NEAR(scale * grad.ctau(a, b), fd_tau, 1e-6);
            const double fd_c0 = (loss(bump(c0, a, b, h), ctau) - loss(bump(c0, a, b, -h), ctau))
                               / (2.0 * h);
            EXPECT_NEAR(scale * grad.c0(a, b), fd_c0, 1e-6);
        }
    }
}

TEST(GeneralizedEigenSolver, EigenvectorGradientMatchesFiniteDifferences) {
    const Eigen::Index d = 3;
    const Matrix c0 = random_spd(d, 31);
    Matrix ctau = Matrix::Zero(d, d);
    ctau.diagonal() << 0.9, 0.4, -0.3;
    ctau += 0.05 * random_symmetric(d, 32);

    const Matrix gv = random_matrix(d, 2, 33);
    Vector gl(2);
    gl << 0.3, 0.7;

    auto loss = [&](const Matrix& a, const Matrix& b) {
        const auto eig = GeneralizedEigenSolver::solve(a, b, 2);
        return eig.eigenvalues.dot(gl) + eig.eigenvectors.cwiseProduct(gv).sum();
    };

    const auto full = GeneralizedEigenSolver::solve_full(c0, ctau);
    const auto grad = GeneralizedEigenSolver::backward(full, gl, gv);

    const double h = 1e-6;
    for (Eigen::Index a = 0; a < d; ++a) {
        for (Eigen::Index b = a; b < d; ++b) {
            const double scale = (a == b) ? 1.0 : 2.0;
            const double fd_tau = (loss(c0, bump(ctau, a, b, h)) - loss(c0, bump(ctau, a, b, -h)))
                                / (2.0 * h);
            EXPECT_NEAR(scale * grad.ctau(a, b), fd_tau, 1e-5);
            const double fd_c0 = (loss(bump(c0, a, b, h), ctau) - loss(bump(c0, a, b, -h), ctau))
                               / (2.0 * h);
            EXPECT_NEAR(scale * grad.c0(a, b), fd_c0, 1e-5);
        }
    }
}

TEST(GeneralizedEigenSolver, DegenerateSpectrumGivesFiniteGradients) {
    const Matrix c0   = Matrix::Identity(3, 3);
    const Matrix ctau = 0.5 * Matrix::Identity(3, 3);
    const auto full = GeneralizedEigenSolver::solve_full(c0, ctau);

    const auto value_grad = GeneralizedEigenSolver::backward(full, Vector::Ones(2));
    EXPECT_TRUE(value_grad.c0.allFinite());
    EXPECT_TRUE(value_grad.ctau.allFinite());

    const auto vector_grad = GeneralizedEigenSolver::backward(full, Vector::Ones(2),
                                                              Matrix::Ones(3, 2));
    EXPECT_TRUE(vector_grad.c0.allFinite());
    EXPECT_TRUE(vector_grad.ctau.allFinite());
}

TEST(GeneralizedEigenSolver, BackwardRejectsWrongGradientLength) {
    const auto full = GeneralizedEigenSolver::solve_full(random_spd(2, 41), random_symmetric(2, 42));
    EXPECT_THROW(static_cast<void>(GeneralizedEigenSolver::backward(full, Vector::Ones(3))),
                 ShapeMismatchError);
    EXPECT_THROW(static_cast<void>(GeneralizedEigenSolver::backward(full, Vector::Ones(1),
                                                                    Matrix::Ones(2, 2))),
                 ShapeMismatchError);
}
