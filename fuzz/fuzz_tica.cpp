/**
 * @file  fuzz_tica.cpp
 * @brief libFuzzer target for CovarianceEstimator + GeneralizedEigenSolver
 *
 * Build:
 *   cmake -DMLCV_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_tica
 *
 * Run for 60 seconds:
 *   ./fuzz_tica -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any feature values including NaN,
 *      ±Inf, ±0.0 and subnormals.
 *   2. Bad input surfaces as a ShapeMismatchError or
 *      NumericalInstabilityError, never as NaN in a returned result.
 *   3. A successful solve returns finite, descending eigenvalues.
 *
 * Fuzzer strategy:
 *   byte 0        → feature count d ∈ [1, 4]
 *   remaining     → doubles, filled row-wise into x_t then x_lag
 */

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <cassert>
#include <cmath>

#include "mlcv/errors.hpp"
#include "mlcv/tica.hpp"

using namespace mlcv;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 1) {
        return 0;
    }
    const Eigen::Index d = 1 + static_cast<Eigen::Index>(data[0] % 4);
    const std::size_t n_doubles = (size - 1) / sizeof(double);
    const auto n = static_cast<Eigen::Index>(n_doubles / static_cast<std::size_t>(2 * d));
    if (n < 1) {
        return 0;
    }

    TimeLagPair pair{
        .x_t   = Matrix(n, d),
        .x_lag = Matrix(n, d),
        .w_t   = uniform_weights(n),
        .w_lag = uniform_weights(n),
    };
    const uint8_t* cursor = data + 1;
    for (Matrix* m : {&pair.x_t, &pair.x_lag}) {
        for (Eigen::Index i = 0; i < n; ++i) {
            for (Eigen::Index j = 0; j < d; ++j) {
                double v = 0.0;
                std::memcpy(&v, cursor, sizeof(double));
                cursor += sizeof(double);
                (*m)(i, j) = v;
            }
        }
    }

    try {
        tica::TicaEngine engine(d, d);
        const EigenDecomposition eig = engine.compute(pair, true);
        assert(eig.eigenvalues.allFinite());
        for (Eigen::Index i = 1; i < eig.eigenvalues.size(); ++i) {
            assert(eig.eigenvalues(i - 1) >= eig.eigenvalues(i));
        }
    } catch (const ShapeMismatchError&) {
    } catch (const NumericalInstabilityError&) {
    }

    return 0;
}
