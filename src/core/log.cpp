/// @file src/core/log.cpp
/// @brief Process-wide verbosity for mlcv::log.

#include "mlcv/log.hpp"

namespace mlcv::log {

namespace {

Level g_level = Level::Info;

} // anonymous namespace

void set_level(Level level) noexcept {
    g_level = level;
}

Level level() noexcept {
    return g_level;
}

} // namespace mlcv::log
