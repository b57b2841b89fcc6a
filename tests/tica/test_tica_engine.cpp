/// @file tests/tica/test_tica_engine.cpp
/// @brief Unit tests for TicaEngine.
///
/// Test categories:
///   - Recovery of known autocorrelations from AR(1) trajectories
///   - Parameter caching and the output projection
///   - Regularization handling
///   - Feature gradient against finite differences
///   - Configuration and shape errors

#include <gtest/gtest.h>
#include "mlcv/errors.hpp"
#include "mlcv/tica.hpp"

#include <cmath>
#include <random>

using namespace mlcv;
using namespace mlcv::tica;

// ─── Helpers ─────────────────────────────────────────────────────────────────

/// Independent AR(1) processes x_j(t+1) = a_j x_j(t) + noise, lag 1 pairs.
static TimeLagPair ar1_pair(const std::vector<double>& coeffs, Eigen::Index n, unsigned seed) {
    std::mt19937_64 rng(seed);
    std::normal_distribution<double> noise(0.0, 1.0);
    const auto d = static_cast<Eigen::Index>(coeffs.size());
    Matrix traj(n + 1, d);
    for (Eigen::Index j = 0; j < d; ++j) {
        const double a = coeffs[static_cast<std::size_t>(j)];
        traj(0, j) = noise(rng) / std::sqrt(1.0 - a * a);
    }
    for (Eigen::Index t = 1; t <= n; ++t) {
        for (Eigen::Index j = 0; j < d; ++j) {
            traj(t, j) = coeffs[static_cast<std::size_t>(j)] * traj(t - 1, j) + noise(rng);
        }
    }
    return TimeLagPair{
        .x_t   = traj.topRows(n),
        .x_lag = traj.bottomRows(n),
        .w_t   = uniform_weights(n),
        .w_lag = uniform_weights(n),
    };
}

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

// ─── AR(1) recovery ──────────────────────────────────────────────────────────

TEST(TicaEngine, RecoversAutocorrelationOfIndependentAr1) {
    const TimeLagPair pair = ar1_pair({0.9, 0.5}, 200000, 2024);
    TicaEngine engine(2, 2);
    const auto eig = engine.compute(pair);

    EXPECT_NEAR(eig.eigenvalues(0), 0.9, 0.009);
    EXPECT_NEAR(eig.eigenvalues(1), 0.5, 0.02);
    // The slow mode is carried by the first coordinate.
    EXPECT_GT(std::abs(eig.eigenvectors(0, 0)), 10.0 * std::abs(eig.eigenvectors(1, 0)));
}

TEST(TicaEngine, MixedCoordinatesStillFindSlowMode) {
    TimeLagPair pair = ar1_pair({0.95, 0.2}, 50000, 7);
    Matrix mix(2, 2);
    mix << 1.0, 0.5,
          -0.3, 1.0;
    pair.x_t   = pair.x_t * mix;
    pair.x_lag = pair.x_lag * mix;

    TicaEngine engine(2, 1);
    const auto eig = engine.compute(pair);
    ASSERT_EQ(eig.eigenvalues.size(), 1);
    EXPECT_NEAR(eig.eigenvalues(0), 0.95, 0.02);
}

// ─── Parameters and projection ───────────────────────────────────────────────

TEST(TicaEngine, InitialProjectionSelectsLeadingAxes) {
    TicaEngine engine(3, 2);
    EXPECT_FALSE(engine.has_params());
    EXPECT_FALSE(engine.has_tape());
    const Matrix x = random_matrix(4, 3, 1);
    EXPECT_TRUE(engine.project(x).isApprox(x.leftCols(2)));
    EXPECT_EQ(engine.kind(), "tica");
}

TEST(TicaEngine, SaveParamsCachesProjection) {
    const TimeLagPair pair = ar1_pair({0.8, 0.3, 0.1}, 2000, 3);
    TicaEngine engine(3, 2);

    const auto unsaved = engine.compute(pair);
    EXPECT_FALSE(engine.has_params());
    EXPECT_TRUE(engine.has_tape());

    const auto saved = engine.compute(pair, true);
    EXPECT_TRUE(engine.has_params());
    EXPECT_TRUE(saved.eigenvalues == unsaved.eigenvalues);
    EXPECT_TRUE(engine.eigenvectors() == saved.eigenvectors);
    EXPECT_EQ(engine.mean().size(), 3);

    const Matrix x = random_matrix(5, 3, 4);
    EXPECT_TRUE(engine.forward(x).isApprox(x * saved.eigenvectors));
}

TEST(TicaEngine, DeterministicForIdenticalInput) {
    const TimeLagPair pair = ar1_pair({0.7, 0.4}, 1000, 5);
    TicaEngine a(2, 2);
    TicaEngine b(2, 2);
    const auto ea = a.compute(pair);
    const auto eb = b.compute(pair);
    EXPECT_TRUE(ea.eigenvalues == eb.eigenvalues);
    EXPECT_TRUE(ea.eigenvectors == eb.eigenvectors);
}

// ─── Regularization ──────────────────────────────────────────────────────────

TEST(TicaEngine, RegularizationRescuesRankDeficientFeatures) {
    TimeLagPair pair = ar1_pair({0.8, 0.5}, 500, 6);
    pair.x_t.col(1)   = pair.x_t.col(0);
    pair.x_lag.col(1) = pair.x_lag.col(0);

    TicaEngine engine(2, 1, TicaOptions{.reg_c0 = 0.0});
    EXPECT_THROW(static_cast<void>(engine.compute(pair)), NumericalInstabilityError);

    engine.set_regularization(1e-4);
    EXPECT_DOUBLE_EQ(engine.regularization(), 1e-4);
    const auto eig = engine.compute(pair);
    EXPECT_TRUE(eig.eigenvalues.allFinite());
}

TEST(TicaEngine, RejectsInvalidRegularization) {
    TicaEngine engine(2, 1);
    EXPECT_THROW(engine.set_regularization(-1.0), ConfigurationError);
    EXPECT_THROW(engine.set_regularization(std::nan("")), ConfigurationError);
    EXPECT_THROW(TicaEngine(2, 1, TicaOptions{.reg_c0 = -1e-3}), ConfigurationError);
}

// ─── Gradients ───────────────────────────────────────────────────────────────

TEST(TicaEngine, FeatureGradientMatchesFiniteDifferences) {
    const TimeLagPair pair = ar1_pair({0.8, 0.4, 0.1}, 12, 8);
    Vector g(2);
    g << 1.0, 0.5;

    auto loss = [&](const TimeLagPair& p) {
        TicaEngine probe(3, 2, TicaOptions{.reg_c0 = 1e-3});
        return probe.compute(p).eigenvalues.dot(g);
    };

    TicaEngine engine(3, 2, TicaOptions{.reg_c0 = 1e-3});
    static_cast<void>(engine.compute(pair));
    const auto grad = engine.backward(g);

    const double h = 1e-6;
    for (Eigen::Index i = 0; i < pair.x_t.rows(); ++i) {
        for (Eigen::Index j = 0; j < 3; ++j) {
            TimeLagPair up = pair;
            TimeLagPair down = pair;
            up.x_t(i, j) += h;
            down.x_t(i, j) -= h;
            EXPECT_NEAR(grad.x_t(i, j), (loss(up) - loss(down)) / (2.0 * h), 1e-5);

            up = pair;
            down = pair;
            up.x_lag(i, j) += h;
            down.x_lag(i, j) -= h;
            EXPECT_NEAR(grad.x_lag(i, j), (loss(up) - loss(down)) / (2.0 * h), 1e-5);
        }
    }
}

TEST(TicaEngine, BackwardNeedsATape) {
    TicaEngine engine(2, 1);
    EXPECT_THROW(static_cast<void>(engine.backward(Vector::Ones(1))), Error);
}

TEST(TicaEngine, BackwardRejectsWrongGradientLength) {
    TicaEngine engine(2, 1);
    static_cast<void>(engine.compute(ar1_pair({0.5, 0.2}, 100, 9)));
    EXPECT_THROW(static_cast<void>(engine.backward(Vector::Ones(2))), ShapeMismatchError);
}

// ─── Errors ──────────────────────────────────────────────────────────────────

TEST(TicaEngine, RejectsOutFeaturesAboveInFeatures) {
    EXPECT_THROW(TicaEngine(2, 3), ConfigurationError);
    EXPECT_THROW(TicaEngine(2, 0), ConfigurationError);
}

TEST(TicaEngine, RejectsWrongFeatureWidth) {
    TicaEngine engine(3, 1);
    EXPECT_THROW(static_cast<void>(engine.compute(ar1_pair({0.5, 0.2}, 50, 10))),
                 ShapeMismatchError);
    EXPECT_THROW(static_cast<void>(engine.project(random_matrix(4, 2, 11))), ShapeMismatchError);
}

TEST(TicaEngine, RunningModeTracksBatches) {
    TicaEngine engine(2, 1, TicaOptions{.running_momentum = 0.5});
    static_cast<void>(engine.compute(ar1_pair({0.9, 0.1}, 500, 12)));
    static_cast<void>(engine.compute(ar1_pair({0.9, 0.1}, 500, 13)));
    EXPECT_EQ(engine.estimator().batches_seen(), 2u);
    EXPECT_TRUE(engine.estimator().is_running());
}
