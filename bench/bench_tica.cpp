/**
 * @file  bench/bench_tica.cpp
 * @brief Google Benchmark suite for the TICA statistics and a DeepTICA step.
 *
 * Benchmarks
 * ----------
 *   BM_Covariance_Estimate      — weighted C(0)/C(τ) over N samples, d = 16
 *   BM_Covariance_Backward      — feature gradient of the same estimate
 *   BM_Eigen_SolveFull          — generalized eigenproblem, d × d
 *   BM_DeepTica_TrainingStep    — forward + backward of {16, 32, 32, 4}
 *
 * Build (CMake):
 *   cmake -B build -DMLCV_BENCH=ON
 *   cmake --build build --target bench_tica
 *   ./build/bench_tica --benchmark_format=json
 *
 * Throughput units: items/second (samples processed).
 */

#include "benchmark/benchmark.h"

#include "mlcv/dataset.hpp"
#include "mlcv/deeptica.hpp"
#include "mlcv/stats.hpp"

#include <random>

using namespace mlcv;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static Matrix ar1_trajectory(Eigen::Index n, Eigen::Index d, unsigned seed) {
    std::mt19937_64 rng(seed);
    std::normal_distribution<double> noise(0.0, 1.0);
    Matrix x(n, d);
    x.row(0).setZero();
    for (Eigen::Index t = 1; t < n; ++t) {
        for (Eigen::Index j = 0; j < d; ++j) {
            const double phi = 0.9 - 0.05 * static_cast<double>(j);
            x(t, j) = phi * x(t - 1, j) + noise(rng);
        }
    }
    return x;
}

static TimeLagPair make_pair(Eigen::Index n, Eigen::Index d) {
    const TimeLagBatch batch = core::build_timelagged_dataset(ar1_trajectory(n + 1, d, 7), 1);
    return TimeLagPair{
        .x_t   = batch.data,
        .x_lag = batch.data_lag,
        .w_t   = batch.weights,
        .w_lag = batch.weights_lag,
    };
}

// ─── Covariance ──────────────────────────────────────────────────────────────

static void BM_Covariance_Estimate(benchmark::State& state) {
    const auto n = static_cast<Eigen::Index>(state.range(0));
    const TimeLagPair pair = make_pair(n, 16);
    stats::CovarianceEstimator est;

    for (auto _ : state) {
        auto out = est.estimate(pair, 1e-6);
        benchmark::DoNotOptimize(out.c0.data());
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(BM_Covariance_Estimate)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

static void BM_Covariance_Backward(benchmark::State& state) {
    const auto n = static_cast<Eigen::Index>(state.range(0));
    const TimeLagPair pair = make_pair(n, 16);
    stats::CovarianceEstimator est;
    const stats::CovarianceEstimate cov = est.estimate(pair, 1e-6);
    const stats::CovarianceGradient grad{
        .c0   = Matrix::Identity(16, 16),
        .ctau = Matrix::Identity(16, 16),
    };

    for (auto _ : state) {
        auto out = est.backward(pair, grad, cov.batch_share);
        benchmark::DoNotOptimize(out.x_t.data());
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(BM_Covariance_Backward)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

// ─── Eigensolver ─────────────────────────────────────────────────────────────

static void BM_Eigen_SolveFull(benchmark::State& state) {
    const auto d = static_cast<Eigen::Index>(state.range(0));
    const TimeLagPair pair = make_pair(4096, d);
    stats::CovarianceEstimator est;
    const stats::CovarianceEstimate cov = est.estimate(pair, 1e-6);

    for (auto _ : state) {
        auto out = stats::GeneralizedEigenSolver::solve_full(cov.c0, cov.ctau);
        benchmark::DoNotOptimize(out.eigenvalues.data());
        benchmark::ClobberMemory();
    }
    state.counters["dim"] = static_cast<double>(d);
}
BENCHMARK(BM_Eigen_SolveFull)->RangeMultiplier(2)->Range(4, 64)->Unit(benchmark::kMicrosecond);

// ─── DeepTICA ────────────────────────────────────────────────────────────────

static void BM_DeepTica_TrainingStep(benchmark::State& state) {
    const auto n = static_cast<Eigen::Index>(state.range(0));
    const TimeLagBatch batch = core::build_timelagged_dataset(ar1_trajectory(n + 1, 16, 11), 1);
    cv::DeepTicaCV model({16, 32, 32, 4});
    model.set_training(true);

    for (auto _ : state) {
        const double value = model.training_step(batch, 0);
        benchmark::DoNotOptimize(value);
        for (blocks::Parameter& p : model.parameters()) {
            p.zero_grad();
        }
    }
    state.SetItemsProcessed(state.iterations() * n);
    state.counters["Msamples_per_sec"] = benchmark::Counter(
        static_cast<double>(state.iterations() * n) / 1e6, benchmark::Counter::kIsRate);
}
BENCHMARK(BM_DeepTica_TrainingStep)->RangeMultiplier(4)->Range(256, 16384)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
