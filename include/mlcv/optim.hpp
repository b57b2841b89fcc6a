#pragma once

/// @file include/mlcv/optim.hpp
/// @brief Gradient-descent optimizers over a model's ParameterList.
///
/// Adam update per parameter tensor (t = step count, g = accumulated grad):
///   m ← β₁ m + (1 − β₁) g
///   v ← β₂ v + (1 − β₂) g²
///   p ← p − lr · m̂ / (√v̂ + ε),   m̂ = m / (1 − β₁ᵗ),  v̂ = v / (1 − β₂ᵗ)

#include "mlcv/blocks.hpp"
#include "mlcv/constants.hpp"

#include <cstddef>
#include <string_view>
#include <vector>

namespace mlcv::train {

class Optimizer {
public:
    virtual ~Optimizer() = default;

    /// Apply one update using the gradients currently stored in the
    /// parameters.
    virtual void step() = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// Zero every parameter gradient.
    void zero_grad();

    [[nodiscard]] const blocks::ParameterList& parameters() const noexcept { return params_; }

protected:
    explicit Optimizer(blocks::ParameterList params) : params_(std::move(params)) {}

    blocks::ParameterList params_;
};

struct AdamOptions {
    double learning_rate = constants::DEFAULT_LEARNING_RATE;
    double beta1         = constants::ADAM_BETA1;
    double beta2         = constants::ADAM_BETA2;
    double epsilon       = constants::ADAM_EPSILON;
};

class Adam final : public Optimizer {
public:
    /// Throws `ConfigurationError` for a non-positive learning rate or
    /// betas outside [0, 1).
    explicit Adam(blocks::ParameterList params, AdamOptions options = {});

    void step() override;

    [[nodiscard]] std::string_view name() const noexcept override { return "adam"; }

    [[nodiscard]] std::size_t steps_taken() const noexcept { return t_; }
    [[nodiscard]] const AdamOptions& options() const noexcept { return options_; }

private:
    AdamOptions         options_;
    std::size_t         t_ = 0;
    std::vector<Matrix> m_;
    std::vector<Matrix> v_;
};

} // namespace mlcv::train
