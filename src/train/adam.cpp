/// @file src/train/adam.cpp
/// @brief Optimizer base and Adam.

#include "mlcv/optim.hpp"
#include "mlcv/errors.hpp"

#include <fmt/core.h>

#include <cmath>

namespace mlcv::train {

void Optimizer::zero_grad() {
    for (auto& p : params_) {
        p.get().zero_grad();
    }
}

// ─── Adam ─────────────────────────────────────────────────────────────────────

Adam::Adam(blocks::ParameterList params, AdamOptions options)
    : Optimizer(std::move(params)), options_(options) {
    if (!(options_.learning_rate > 0.0) || !std::isfinite(options_.learning_rate)) {
        throw ConfigurationError(fmt::format(
            "learning rate must be positive, got {}", options_.learning_rate));
    }
    if (options_.beta1 < 0.0 || options_.beta1 >= 1.0 ||
        options_.beta2 < 0.0 || options_.beta2 >= 1.0) {
        throw ConfigurationError(fmt::format(
            "Adam betas must lie in [0, 1), got {} and {}",
            options_.beta1, options_.beta2));
    }
    m_.reserve(params_.size());
    v_.reserve(params_.size());
    for (const auto& p : params_) {
        const Matrix& value = p.get().value;
        m_.push_back(Matrix::Zero(value.rows(), value.cols()));
        v_.push_back(Matrix::Zero(value.rows(), value.cols()));
    }
}

void Adam::step() {
    ++t_;
    const double bias1 = 1.0 - std::pow(options_.beta1, static_cast<double>(t_));
    const double bias2 = 1.0 - std::pow(options_.beta2, static_cast<double>(t_));

    for (std::size_t i = 0; i < params_.size(); ++i) {
        blocks::Parameter& p = params_[i].get();
        if (p.grad.rows() != p.value.rows() || p.grad.cols() != p.value.cols()) {
            throw ShapeMismatchError(fmt::format(
                "parameter {} is {}x{} but its gradient is {}x{}",
                i, p.value.rows(), p.value.cols(), p.grad.rows(), p.grad.cols()));
        }
        m_[i] = options_.beta1 * m_[i] + (1.0 - options_.beta1) * p.grad;
        v_[i] = options_.beta2 * v_[i]
              + (1.0 - options_.beta2) * p.grad.cwiseProduct(p.grad);

        const Matrix m_hat = m_[i] / bias1;
        const Matrix v_hat = v_[i] / bias2;
        p.value.array() -= options_.learning_rate * m_hat.array()
                         / (v_hat.array().sqrt() + options_.epsilon);
    }
}

} // namespace mlcv::train
