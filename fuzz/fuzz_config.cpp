/**
 * @file  fuzz_config.cpp
 * @brief libFuzzer target for parse_config and parse_layers
 *
 * Build:
 *   cmake -DMLCV_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_config
 *
 * Run for 60 seconds:
 *   ./fuzz_config -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. The only exception that escapes is ConfigurationError.
 *   3. An accepted configuration has every layer ≥ 1, a finite reg_c0 and
 *      learning rate, and out_features ≥ 1 when set.
 */

#include <cstddef>
#include <cstdint>
#include <cassert>
#include <cmath>
#include <string>

#include "mlcv/config.hpp"
#include "mlcv/errors.hpp"

using namespace mlcv;
using namespace mlcv::cv;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input(reinterpret_cast<const char*>(data), size);

    try {
        const ModelConfig cfg = parse_config(input);
        for (const Eigen::Index n : cfg.layers) {
            assert(n >= 1);
        }
        assert(std::isfinite(cfg.tica.options.reg_c0));
        assert(std::isfinite(cfg.learning_rate));
        if (cfg.out_features) {
            assert(*cfg.out_features >= 1);
        }
    } catch (const ConfigurationError&) {
        // Rejected input: expected.
    }

    try {
        const auto layers = parse_layers(input);
        assert(!layers.empty());
    } catch (const ConfigurationError&) {
    }

    return 0;
}
