/// @file src/pipeline/config.cpp
/// @brief `section.key = value` parsing for ModelConfig.

#include "mlcv/config.hpp"
#include "mlcv/errors.hpp"
#include "mlcv/stats.hpp"

#include <fmt/core.h>

#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace mlcv::cv {

// ─── Internal helpers ─────────────────────────────────────────────────────────

namespace {

[[nodiscard]] std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

[[nodiscard]] double to_double(const std::string& key, const std::string& value) {
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(value.c_str(), &end);
    if (value.empty() || end != value.c_str() + value.size() || errno == ERANGE ||
        !std::isfinite(v)) {
        throw ConfigurationError(fmt::format("{}: '{}' is not a number", key, value));
    }
    return v;
}

[[nodiscard]] long long to_integer(const std::string& key, const std::string& value) {
    errno = 0;
    char* end = nullptr;
    const long long v = std::strtoll(value.c_str(), &end, 10);
    if (value.empty() || end != value.c_str() + value.size() || errno == ERANGE) {
        throw ConfigurationError(fmt::format("{}: '{}' is not an integer", key, value));
    }
    return v;
}

[[nodiscard]] std::size_t to_count(const std::string& key, const std::string& value) {
    const long long v = to_integer(key, value);
    if (v < 0) {
        throw ConfigurationError(fmt::format("{}: expected a count >= 0, got {}", key, v));
    }
    return static_cast<std::size_t>(v);
}

[[nodiscard]] bool to_bool(const std::string& key, const std::string& value) {
    if (value == "true" || value == "1" || value == "yes" || value == "on")   return true;
    if (value == "false" || value == "0" || value == "no" || value == "off") return false;
    throw ConfigurationError(fmt::format("{}: '{}' is not a boolean", key, value));
}

template <typename T>
[[nodiscard]] T require(std::optional<T> parsed, const std::string& key,
                        const std::string& value) {
    if (!parsed) {
        throw ConfigurationError(fmt::format("{}: unknown value '{}'", key, value));
    }
    return *parsed;
}

void apply(ModelConfig& cfg, const std::string& key, const std::string& value) {
    if (key == "layers") {
        cfg.layers = parse_layers(value);
    } else if (key == "out_features") {
        const long long k = to_integer(key, value);
        if (k < 1) {
            throw ConfigurationError(fmt::format("out_features must be >= 1, got {}", k));
        }
        cfg.out_features = static_cast<Eigen::Index>(k);
    } else if (key == "normIn") {
        cfg.norm_in.enabled = to_bool(key, value);
    } else if (key == "normIn.mode") {
        cfg.norm_in.options.mode =
            require(blocks::parse_normalization_mode(value), key, value);
    } else if (key == "nn") {
        cfg.nn.enabled = to_bool(key, value);
    } else if (key == "nn.activation") {
        cfg.nn.options.activation = require(blocks::parse_activation(value), key, value);
    } else if (key == "nn.activate_last") {
        cfg.nn.options.activate_last = to_bool(key, value);
    } else if (key == "nn.seed") {
        cfg.nn.options.seed = static_cast<std::uint64_t>(to_count(key, value));
    } else if (key == "tica") {
        cfg.tica.enabled = to_bool(key, value);
    } else if (key == "tica.reg_c0") {
        cfg.tica.options.reg_c0 = to_double(key, value);
    } else if (key == "tica.c0_policy") {
        cfg.tica.options.c0_policy = require(stats::parse_c0_policy(value), key, value);
    } else if (key == "tica.running_momentum") {
        cfg.tica.options.running_momentum = to_double(key, value);
    } else if (key == "normOut") {
        cfg.norm_out.enabled = to_bool(key, value);
    } else if (key == "normOut.mode") {
        cfg.norm_out.options.mode =
            require(blocks::parse_normalization_mode(value), key, value);
    } else if (key == "loss.mode") {
        cfg.loss.mode = require(loss::parse_reduction_mode(value), key, value);
    } else if (key == "loss.n_eig") {
        cfg.loss.n_eig = to_count(key, value);
    } else if (key == "optimizer.lr") {
        cfg.learning_rate = to_double(key, value);
    } else {
        throw ConfigurationError(fmt::format("unknown configuration key '{}'", key));
    }
}

} // anonymous namespace

// ─── parse_layers ─────────────────────────────────────────────────────────────

std::vector<Eigen::Index> parse_layers(const std::string& text) {
    std::vector<Eigen::Index> layers;
    std::istringstream ss(text);
    std::string token;
    while (std::getline(ss, token, ',')) {
        token = trim(token);
        const long long n = to_integer("layers", token);
        if (n < 1) {
            throw ConfigurationError(fmt::format(
                "layers: every layer needs at least 1 neuron, got {}", n));
        }
        layers.push_back(static_cast<Eigen::Index>(n));
    }
    if (layers.empty()) {
        throw ConfigurationError("layers: empty layer list");
    }
    return layers;
}

// ─── parse_config / load_config ───────────────────────────────────────────────

ModelConfig parse_config(const std::string& text, ModelConfig base) {
    std::istringstream stream(text);
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(stream, line)) {
        ++line_no;
        const auto hash = line.find('#');
        if (hash != std::string::npos) {
            line.erase(hash);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        const auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigurationError(fmt::format(
                "config line {}: expected 'key = value', got '{}'", line_no, line));
        }
        const std::string key   = trim(line.substr(0, eq));
        const std::string value = trim(line.substr(eq + 1));
        try {
            apply(base, key, value);
        } catch (const ConfigurationError& e) {
            throw ConfigurationError(fmt::format("config line {}: {}", line_no, e.what()));
        }
    }
    return base;
}

std::optional<ModelConfig> load_config(const std::string& path, ModelConfig base) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_config(contents.str(), std::move(base));
}

} // namespace mlcv::cv
