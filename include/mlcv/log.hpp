#pragma once

/// @file include/mlcv/log.hpp
/// @brief Minimal stderr logging on top of fmt.
///
/// Messages are written as `[mlcv] <text>` to stderr. The level is process
/// wide and defaults to Info; the CLI raises it with --verbose and tests
/// silence it with Quiet.

#include <fmt/core.h>

#include <cstdio>
#include <utility>

namespace mlcv::log {

enum class Level { Quiet = 0, Warn = 1, Info = 2, Debug = 3 };

/// Set the global verbosity.
void set_level(Level level) noexcept;

/// Current global verbosity.
[[nodiscard]] Level level() noexcept;

[[nodiscard]] inline bool enabled(Level at) noexcept {
    return static_cast<int>(level()) >= static_cast<int>(at);
}

template <typename... Args>
void warn(fmt::format_string<Args...> format, Args&&... args) {
    if (enabled(Level::Warn)) {
        fmt::print(stderr, "[mlcv] warning: {}\n",
                   fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void info(fmt::format_string<Args...> format, Args&&... args) {
    if (enabled(Level::Info)) {
        fmt::print(stderr, "[mlcv] {}\n",
                   fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void debug(fmt::format_string<Args...> format, Args&&... args) {
    if (enabled(Level::Debug)) {
        fmt::print(stderr, "[mlcv:debug] {}\n",
                   fmt::format(format, std::forward<Args>(args)...));
    }
}

} // namespace mlcv::log
