/**
 * @file  prop_weight_scaling.cpp
 * @brief Property: covariance estimates are invariant to a global weight scale
 *
 * Run with 1,000 random batches:
 *   RC_PARAMS="max_success=1000" ./prop_weight_scaling
 *
 * For any positive c:
 *   estimate(x_t, x_lag, c·w_t, c·w_lag) == estimate(x_t, x_lag, w_t, w_lag)
 * to 1e-10 relative, under both C(0) policies. The same holds for the
 * eigenvalues of the resulting generalized problem.
 */

#include <rapidcheck.h>
#include <cmath>
#include <random>

#include "mlcv/stats.hpp"

using namespace mlcv;
using namespace mlcv::stats;

namespace {

TimeLagPair random_pair(Eigen::Index n, Eigen::Index d, unsigned seed) {
    std::mt19937_64 rng(seed);
    std::normal_distribution<double> normal(0.0, 1.0);
    std::uniform_real_distribution<double> weight(0.1, 3.0);
    TimeLagPair p{
        .x_t   = Matrix(n, d),
        .x_lag = Matrix(n, d),
        .w_t   = Vector(n),
        .w_lag = Vector(n),
    };
    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = 0; j < d; ++j) {
            p.x_t(i, j)   = normal(rng);
            p.x_lag(i, j) = 0.5 * p.x_t(i, j) + normal(rng);
        }
        p.w_t(i)   = weight(rng);
        p.w_lag(i) = weight(rng);
    }
    return p;
}

bool approx_equal(const Matrix& a, const Matrix& b) {
    return (a - b).cwiseAbs().maxCoeff() <= 1e-10 * (1.0 + a.cwiseAbs().maxCoeff());
}

} // anonymous namespace

int main() {
    rc::check(
        "weight_scaling: C0 and Ctau unchanged by a positive weight scale",
        [](bool pooled) {
            const auto d     = *rc::gen::inRange<Eigen::Index>(1, 5);
            const auto n     = *rc::gen::inRange<Eigen::Index>(d + 2, 60);
            const auto seed  = *rc::gen::arbitrary<unsigned>();
            const auto scale = *rc::gen::inRange(1, 10000);
            const double c   = static_cast<double>(scale) / 100.0;

            const TimeLagPair p = random_pair(n, d, seed);
            TimeLagPair scaled  = p;
            scaled.w_t   *= c;
            scaled.w_lag *= c;

            CovarianceEstimator est(pooled ? C0Policy::Pooled : C0Policy::Instantaneous);
            const auto a = est.estimate(p, 1e-6);
            const auto b = est.estimate(scaled, 1e-6);
            RC_ASSERT(approx_equal(a.c0, b.c0));
            RC_ASSERT(approx_equal(a.ctau, b.ctau));
            RC_ASSERT(approx_equal(a.mean, b.mean));

            const auto ea = GeneralizedEigenSolver::solve_full(a.c0, a.ctau);
            const auto eb = GeneralizedEigenSolver::solve_full(b.c0, b.ctau);
            RC_ASSERT(approx_equal(ea.eigenvalues, eb.eigenvalues));
        }
    );

    return 0;
}
