/// @file src/blocks/block.cpp
/// @brief Shared Block input validation.

#include "mlcv/blocks.hpp"
#include "mlcv/errors.hpp"

#include <fmt/core.h>

namespace mlcv::blocks {

void Block::check_input(const Matrix& x) const {
    if (x.cols() != in_features()) {
        throw ShapeMismatchError(fmt::format(
            "{} block expects {} input features, got a {}x{} batch",
            kind(), in_features(), x.rows(), x.cols()));
    }
}

} // namespace mlcv::blocks
