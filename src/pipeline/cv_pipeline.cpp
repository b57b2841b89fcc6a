/// @file src/pipeline/cv_pipeline.cpp
/// @brief CVPipeline — slot wiring, forward, lifecycle forwarding, tracing.

#include "mlcv/pipeline.hpp"
#include "mlcv/errors.hpp"

#include <fmt/core.h>

#include <array>
#include <string_view>
#include <utility>

namespace mlcv::cv {

// ─── Constructor ──────────────────────────────────────────────────────────────

CVPipeline::CVPipeline(PipelineSlots slots) : slots_(std::move(slots)) {
    const std::array<std::pair<std::string_view, const blocks::Block*>, 4> chain{{
        {"normIn",  norm_in()},
        {"nn",      nn()},
        {"tica",    tica()},
        {"normOut", norm_out()},
    }};

    const blocks::Block* prev = nullptr;
    std::string_view prev_name;
    for (const auto& [name, block] : chain) {
        if (block == nullptr) {
            continue;
        }
        if (prev != nullptr && prev->out_features() != block->in_features()) {
            throw ConfigurationError(fmt::format(
                "{} produces {} features but {} expects {}",
                prev_name, prev->out_features(), name, block->in_features()));
        }
        prev      = block;
        prev_name = name;
    }
    if (prev == nullptr) {
        throw ConfigurationError("a CV pipeline needs at least one block");
    }
}

// ─── forward ──────────────────────────────────────────────────────────────────

Matrix CVPipeline::forward(const Matrix& x) {
    Matrix h = forward_nn(x);
    if (auto* t = tica()) {
        h = t->forward(h);
    }
    if (auto* n = norm_out()) {
        h = n->forward(h);
    }
    return h;
}

Matrix CVPipeline::forward_nn(const Matrix& x) {
    Matrix h = x;
    if (auto* n = norm_in()) {
        h = n->forward(h);
    }
    if (auto* f = nn()) {
        h = f->forward(h);
    }
    return h;
}

Matrix CVPipeline::forward_nn(const Matrix& x, NnTape& tape) {
    Matrix h = x;
    if (auto* n = norm_in()) {
        h = n->forward(h);
    }
    if (auto* f = nn()) {
        h = f->forward(h, tape.nn);
    }
    return h;
}

Matrix CVPipeline::backward_nn(const NnTape& tape, const Matrix& grad_features) {
    Matrix grad = grad_features;
    if (auto* f = nn()) {
        grad = f->backward(tape.nn, grad);
    }
    if (const auto* n = norm_in()) {
        grad = (grad.array().rowwise() / n->range().array()).matrix();
    }
    return grad;
}

// ─── trace ────────────────────────────────────────────────────────────────────

TracedModel CVPipeline::trace() const {
    std::vector<TracedOp> ops;
    if (const auto* n = norm_in()) {
        ops.emplace_back(Standardize{.mean = n->mean(), .range = n->range()});
    }
    if (const auto* f = nn()) {
        for (const auto& layer : f->layers()) {
            ops.emplace_back(Affine{
                .a = layer.weight.value.transpose(),
                .b = layer.bias.value.row(0),
            });
            if (layer.activated) {
                ops.emplace_back(Activate{.activation = f->options().activation});
            }
        }
    }
    if (const auto* t = tica()) {
        ops.emplace_back(Affine{
            .a = t->eigenvectors(),
            .b = RowVector::Zero(t->out_features()),
        });
    }
    if (const auto* n = norm_out()) {
        ops.emplace_back(Standardize{.mean = n->mean(), .range = n->range()});
    }
    return TracedModel(in_features(), std::move(ops));
}

// ─── Mode and lifecycle ───────────────────────────────────────────────────────

void CVPipeline::set_training(bool training) {
    training_ = training;
    for (auto* b : present_blocks()) {
        b->set_training(training);
    }
}

void CVPipeline::on_train_epoch_start() {
    for (auto* b : present_blocks()) {
        b->on_train_epoch_start();
    }
}

void CVPipeline::on_train_epoch_end() {
    for (auto* b : present_blocks()) {
        b->on_train_epoch_end();
    }
}

void CVPipeline::on_validation_epoch_start() {
    for (auto* b : present_blocks()) {
        b->on_validation_epoch_start();
    }
}

void CVPipeline::on_validation_epoch_end() {
    for (auto* b : present_blocks()) {
        b->on_validation_epoch_end();
    }
}

// ─── Accessors ────────────────────────────────────────────────────────────────

Eigen::Index CVPipeline::in_features() const noexcept {
    if (const auto* b = norm_in())  return b->in_features();
    if (const auto* b = nn())       return b->in_features();
    if (const auto* b = tica())     return b->in_features();
    return norm_out()->in_features();
}

Eigen::Index CVPipeline::out_features() const noexcept {
    if (const auto* b = norm_out()) return b->out_features();
    if (const auto* b = tica())     return b->out_features();
    if (const auto* b = nn())       return b->out_features();
    return norm_in()->out_features();
}

std::vector<blocks::Block*> CVPipeline::present_blocks() {
    std::vector<blocks::Block*> out;
    if (auto* b = norm_in())  out.push_back(b);
    if (auto* b = nn())       out.push_back(b);
    if (auto* b = tica())     out.push_back(b);
    if (auto* b = norm_out()) out.push_back(b);
    return out;
}

std::vector<const blocks::Block*> CVPipeline::present_blocks() const {
    std::vector<const blocks::Block*> out;
    if (const auto* b = norm_in())  out.push_back(b);
    if (const auto* b = nn())       out.push_back(b);
    if (const auto* b = tica())     out.push_back(b);
    if (const auto* b = norm_out()) out.push_back(b);
    return out;
}

} // namespace mlcv::cv
