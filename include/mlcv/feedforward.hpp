#pragma once

/// @file include/mlcv/feedforward.hpp
/// @brief FeedForwardBlock — dense layers and nonlinearities with a manual
///        reverse pass.
///
/// Layer l computes  h_{l+1} = σ(h_l Wₗᵀ + bₗ)  on row batches. The
/// nonlinearity is applied after every layer except the last, unless
/// `activate_last` is set.
///
/// `forward(x, tape)` records the per-layer inputs and pre-activations;
/// `backward(tape, dL/dy)` accumulates dL/dW and dL/db into the layer
/// parameters and returns dL/dx. A tape belongs to one forward call, so two
/// inputs pushed through shared weights keep two tapes.

#include "mlcv/blocks.hpp"
#include "mlcv/constants.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace mlcv::blocks {

enum class Activation { ReLU, ELU, Tanh, Softplus, ShiftedSoftplus, Linear };

[[nodiscard]] std::string_view to_string(Activation activation) noexcept;

/// Parse "relu", "elu", "tanh", "softplus", "shifted_softplus", "linear".
[[nodiscard]] std::optional<Activation> parse_activation(std::string_view text) noexcept;

/// Elementwise σ(pre).
[[nodiscard]] Matrix apply_activation(const Matrix& pre, Activation activation);

/// Elementwise σ'(pre).
[[nodiscard]] Matrix activation_derivative(const Matrix& pre, Activation activation);

struct FeedForwardOptions {
    Activation    activation    = Activation::ReLU;
    bool          activate_last = false;
    std::uint64_t seed          = constants::DEFAULT_SEED;
};

/// One affine layer: weight (out × in), bias (1 × out).
struct DenseLayer {
    Parameter weight;
    Parameter bias;
    bool      activated = true;
};

class FeedForwardBlock final : public Block {
public:
    /// Per-call record of the activations needed by `backward`.
    struct Tape {
        std::vector<Matrix> inputs;           ///< h_l fed into layer l
        std::vector<Matrix> pre_activations;  ///< h_l Wₗᵀ + bₗ
    };

    /// # Arguments
    /// * `layers`  — Neurons per layer including input and output,
    ///               e.g. {2, 10, 10, 2}
    /// * `options` — Activation, last-layer activation, init seed
    ///
    /// Throws `ConfigurationError` for fewer than 2 sizes or a size < 1.
    explicit FeedForwardBlock(std::vector<Eigen::Index> layers,
                              FeedForwardOptions options = {});

    [[nodiscard]] Matrix forward(const Matrix& x) override;

    /// Forward pass that records a tape for `backward`.
    [[nodiscard]] Matrix forward(const Matrix& x, Tape& tape) const;

    /// Accumulate parameter gradients for the call recorded in `tape` and
    /// return dL/dx.
    [[nodiscard]] Matrix backward(const Tape& tape, const Matrix& grad_out);

    [[nodiscard]] ParameterList parameters();
    void zero_grad();

    [[nodiscard]] Eigen::Index in_features() const noexcept override { return sizes_.front(); }
    [[nodiscard]] Eigen::Index out_features() const noexcept override { return sizes_.back(); }
    [[nodiscard]] std::string_view kind() const noexcept override { return "feedforward"; }

    [[nodiscard]] const std::vector<Eigen::Index>& sizes() const noexcept { return sizes_; }
    [[nodiscard]] const FeedForwardOptions& options() const noexcept { return options_; }
    [[nodiscard]] const std::vector<DenseLayer>& layers() const noexcept { return layers_; }
    [[nodiscard]] std::vector<DenseLayer>& layers() noexcept { return layers_; }

private:
    std::vector<Eigen::Index> sizes_;
    FeedForwardOptions        options_;
    std::vector<DenseLayer>   layers_;
};

} // namespace mlcv::blocks
