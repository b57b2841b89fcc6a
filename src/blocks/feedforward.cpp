/// @file src/blocks/feedforward.cpp
/// @brief FeedForwardBlock — dense layers, activations and the reverse pass.

#include "mlcv/feedforward.hpp"
#include "mlcv/errors.hpp"

#include <fmt/core.h>

#include <cmath>
#include <random>

namespace mlcv::blocks {

// ─── Internal helpers ─────────────────────────────────────────────────────────

namespace {

constexpr double LN2 = 0.6931471805599453;

/// log(1 + eˣ) without overflow for large x.
[[nodiscard]] double softplus(double x) noexcept {
    return x > 30.0 ? x : std::log1p(std::exp(x));
}

/// Logistic sigmoid, the derivative of softplus.
[[nodiscard]] double sigmoid(double x) noexcept {
    if (x >= 0.0) {
        return 1.0 / (1.0 + std::exp(-x));
    }
    const double e = std::exp(x);
    return e / (1.0 + e);
}

} // anonymous namespace

// ─── Activation ───────────────────────────────────────────────────────────────

std::string_view to_string(Activation activation) noexcept {
    switch (activation) {
        case Activation::ReLU:            return "relu";
        case Activation::ELU:             return "elu";
        case Activation::Tanh:            return "tanh";
        case Activation::Softplus:        return "softplus";
        case Activation::ShiftedSoftplus: return "shifted_softplus";
        case Activation::Linear:          return "linear";
    }
    return "linear";
}

std::optional<Activation> parse_activation(std::string_view text) noexcept {
    if (text == "relu")             return Activation::ReLU;
    if (text == "elu")              return Activation::ELU;
    if (text == "tanh")             return Activation::Tanh;
    if (text == "softplus")         return Activation::Softplus;
    if (text == "shifted_softplus") return Activation::ShiftedSoftplus;
    if (text == "linear")           return Activation::Linear;
    return std::nullopt;
}

Matrix apply_activation(const Matrix& pre, Activation activation) {
    switch (activation) {
        case Activation::ReLU:
            return pre.cwiseMax(0.0);
        case Activation::ELU:
            return pre.unaryExpr([](double x) { return x > 0.0 ? x : std::expm1(x); });
        case Activation::Tanh:
            return pre.array().tanh().matrix();
        case Activation::Softplus:
            return pre.unaryExpr([](double x) { return softplus(x); });
        case Activation::ShiftedSoftplus:
            return pre.unaryExpr([](double x) { return softplus(x) - LN2; });
        case Activation::Linear:
            return pre;
    }
    return pre;
}

Matrix activation_derivative(const Matrix& pre, Activation activation) {
    switch (activation) {
        case Activation::ReLU:
            return pre.unaryExpr([](double x) { return x > 0.0 ? 1.0 : 0.0; });
        case Activation::ELU:
            return pre.unaryExpr([](double x) { return x > 0.0 ? 1.0 : std::exp(x); });
        case Activation::Tanh:
            return pre.unaryExpr([](double x) {
                const double t = std::tanh(x);
                return 1.0 - t * t;
            });
        case Activation::Softplus:
        case Activation::ShiftedSoftplus:
            return pre.unaryExpr([](double x) { return sigmoid(x); });
        case Activation::Linear:
            return Matrix::Ones(pre.rows(), pre.cols());
    }
    return Matrix::Ones(pre.rows(), pre.cols());
}

// ─── Constructor ──────────────────────────────────────────────────────────────

FeedForwardBlock::FeedForwardBlock(std::vector<Eigen::Index> layers,
                                   FeedForwardOptions options)
    : sizes_(std::move(layers)), options_(options) {
    if (sizes_.size() < 2) {
        throw ConfigurationError(fmt::format(
            "feed-forward block needs at least 2 layer sizes (input and output), got {}",
            sizes_.size()));
    }
    for (std::size_t i = 0; i < sizes_.size(); ++i) {
        if (sizes_[i] < 1) {
            throw ConfigurationError(fmt::format(
                "layer {} has {} neurons; every layer needs at least 1", i, sizes_[i]));
        }
    }

    // He initialization for rectifiers, Xavier otherwise.
    std::mt19937_64 rng(options_.seed);
    const bool rectifier = options_.activation == Activation::ReLU ||
                           options_.activation == Activation::ELU;

    const std::size_t n_layers = sizes_.size() - 1;
    layers_.reserve(n_layers);
    for (std::size_t l = 0; l < n_layers; ++l) {
        const Eigen::Index fan_in  = sizes_[l];
        const Eigen::Index fan_out = sizes_[l + 1];
        const double stddev = rectifier
            ? std::sqrt(2.0 / static_cast<double>(fan_in))
            : std::sqrt(2.0 / static_cast<double>(fan_in + fan_out));
        std::normal_distribution<double> dist(0.0, stddev);

        DenseLayer layer;
        layer.weight.value = Matrix(fan_out, fan_in);
        for (Eigen::Index r = 0; r < fan_out; ++r) {
            for (Eigen::Index c = 0; c < fan_in; ++c) {
                layer.weight.value(r, c) = dist(rng);
            }
        }
        layer.bias.value = Matrix::Constant(1, fan_out, 0.01);
        layer.weight.zero_grad();
        layer.bias.zero_grad();
        layer.activated = (l + 1 < n_layers) || options_.activate_last;
        layers_.push_back(std::move(layer));
    }
}

// ─── forward ──────────────────────────────────────────────────────────────────

Matrix FeedForwardBlock::forward(const Matrix& x) {
    check_input(x);
    Matrix h = x;
    for (const auto& layer : layers_) {
        Matrix pre = (h * layer.weight.value.transpose()).rowwise()
                     + layer.bias.value.row(0);
        h = layer.activated ? apply_activation(pre, options_.activation) : std::move(pre);
    }
    return h;
}

Matrix FeedForwardBlock::forward(const Matrix& x, Tape& tape) const {
    check_input(x);
    tape.inputs.clear();
    tape.pre_activations.clear();
    tape.inputs.reserve(layers_.size());
    tape.pre_activations.reserve(layers_.size());

    Matrix h = x;
    for (const auto& layer : layers_) {
        tape.inputs.push_back(h);
        Matrix pre = (h * layer.weight.value.transpose()).rowwise()
                     + layer.bias.value.row(0);
        h = layer.activated ? apply_activation(pre, options_.activation) : pre;
        tape.pre_activations.push_back(std::move(pre));
    }
    return h;
}

// ─── backward ─────────────────────────────────────────────────────────────────

Matrix FeedForwardBlock::backward(const Tape& tape, const Matrix& grad_out) {
    if (tape.inputs.size() != layers_.size() ||
        tape.pre_activations.size() != layers_.size()) {
        throw ShapeMismatchError(fmt::format(
            "feed-forward tape holds {} layers, block has {}",
            tape.inputs.size(), layers_.size()));
    }
    const Matrix& last = tape.pre_activations.back();
    if (grad_out.rows() != last.rows() || grad_out.cols() != last.cols()) {
        throw ShapeMismatchError(fmt::format(
            "output gradient is {}x{}, expected {}x{}",
            grad_out.rows(), grad_out.cols(), last.rows(), last.cols()));
    }

    Matrix grad = grad_out;
    for (std::size_t i = layers_.size(); i-- > 0;) {
        auto& layer = layers_[i];
        if (layer.activated) {
            grad = grad.cwiseProduct(
                activation_derivative(tape.pre_activations[i], options_.activation));
        }
        layer.weight.grad += grad.transpose() * tape.inputs[i];
        layer.bias.grad   += grad.colwise().sum();
        grad = grad * layer.weight.value;
    }
    return grad;
}

// ─── parameters ───────────────────────────────────────────────────────────────

ParameterList FeedForwardBlock::parameters() {
    ParameterList params;
    params.reserve(2 * layers_.size());
    for (auto& layer : layers_) {
        params.emplace_back(layer.weight);
        params.emplace_back(layer.bias);
    }
    return params;
}

void FeedForwardBlock::zero_grad() {
    for (auto& layer : layers_) {
        layer.weight.zero_grad();
        layer.bias.zero_grad();
    }
}

} // namespace mlcv::blocks
