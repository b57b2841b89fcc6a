/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for DataLoader::parse_string and the lagged pairing
 *
 * Build:
 *   cmake -DMLCV_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. The parsed matrix is either 0×0 or has ≥ 1 row and ≥ 1 column.
 *   3. Every parsed value is finite.
 *   4. For ≥ 2 rows, lag-1 pairing yields rows − 1 pairs whose lagged rows
 *      are the original rows shifted by one.
 */

#include <cstddef>
#include <cstdint>
#include <cassert>
#include <string>

#include "mlcv/data_loader.hpp"
#include "mlcv/dataset.hpp"

using namespace mlcv;
using namespace mlcv::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input(reinterpret_cast<const char*>(data), size);

    const Matrix x = DataLoader::parse_string(input);

    // Invariant 2
    assert((x.rows() == 0 && x.cols() == 0) || (x.rows() > 0 && x.cols() > 0));
    // Invariant 3
    assert(x.allFinite());

    if (x.rows() >= 2) {
        const TimeLagBatch ds = build_timelagged_dataset(x, 1);
        // Invariant 4
        assert(ds.size() == x.rows() - 1);
        assert(ds.data_lag.row(0) == x.row(1));
        assert(ds.weights.sum() == static_cast<double>(ds.size()));
    }

    return 0;
}
