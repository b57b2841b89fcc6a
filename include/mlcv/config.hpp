#pragma once

/// @file include/mlcv/config.hpp
/// @brief ModelConfig — per-block options for a DeepTICA model, and a
///        `section.key = value` text format for them.
///
/// # Module: Configuration
///
/// Every model is built from a fresh ModelConfig value: the struct defaults
/// are the block defaults, and whatever the caller (or a config file) sets
/// overrides them. A slot whose BlockOption is disabled is left empty.
///
/// ## Text format
/// ```
/// # comment
/// layers          = 2,10,10,2
/// out_features    = 1
/// normIn          = true
/// normIn.mode     = min_max
/// nn.activation   = tanh
/// nn.activate_last = false
/// nn.seed         = 7
/// tica.reg_c0     = 1e-5
/// tica.c0_policy  = pooled
/// tica.running_momentum = 0.0
/// normOut         = false
/// loss.mode       = sum2
/// loss.n_eig      = 0
/// optimizer.lr    = 1e-3
/// ```
/// Unknown keys and unparsable values raise `ConfigurationError`.

#include "mlcv/constants.hpp"
#include "mlcv/feedforward.hpp"
#include "mlcv/loss.hpp"
#include "mlcv/normalization.hpp"
#include "mlcv/tica.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mlcv::cv {

/// Options for one pipeline slot: enabled with `options`, or disabled.
template <typename T>
struct BlockOption {
    bool enabled = true;
    T    options{};

    [[nodiscard]] static BlockOption defaults() { return BlockOption{}; }
    [[nodiscard]] static BlockOption with(T opts) { return BlockOption{true, std::move(opts)}; }
    [[nodiscard]] static BlockOption disabled() { return BlockOption{false, T{}}; }
};

struct ModelConfig {
    std::vector<Eigen::Index>   layers;        ///< nn sizes incl. input and output
    std::optional<Eigen::Index> out_features;  ///< CVs; defaults to layers.back()

    BlockOption<blocks::NormalizationOptions> norm_in;
    BlockOption<blocks::FeedForwardOptions>   nn;
    BlockOption<mlcv::tica::TicaOptions>      tica;
    BlockOption<blocks::NormalizationOptions> norm_out;

    mlcv::loss::LossOptions loss;
    double                  learning_rate = constants::DEFAULT_LEARNING_RATE;
};

/// Apply every `key = value` line of `text` on top of `base`.
/// Throws `ConfigurationError` naming the line for unknown keys or bad values.
[[nodiscard]] ModelConfig parse_config(const std::string& text, ModelConfig base = {});

/// `parse_config` on a file. Returns `nullopt` if the file cannot be opened.
[[nodiscard]] std::optional<ModelConfig> load_config(const std::string& path,
                                                     ModelConfig base = {});

/// Parse "2,10,10,2". Throws `ConfigurationError` for an empty list or a
/// non-positive entry.
[[nodiscard]] std::vector<Eigen::Index> parse_layers(const std::string& text);

} // namespace mlcv::cv
