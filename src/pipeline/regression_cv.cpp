/// @file src/pipeline/regression_cv.cpp
/// @brief RegressionCV — slot construction, mean-squared-error step, optimizer.

#include "mlcv/regression.hpp"
#include "mlcv/errors.hpp"
#include "mlcv/log.hpp"

#include <fmt/core.h>

#include <string>

namespace mlcv::cv {

// ─── Internal helpers ─────────────────────────────────────────────────────────

namespace {

[[nodiscard]] RegressionConfig validated(RegressionConfig cfg) {
    if (cfg.layers.size() < 2) {
        throw ConfigurationError(fmt::format(
            "a regression CV needs at least 2 layer sizes (input and output), got {}",
            cfg.layers.size()));
    }
    if (!cfg.nn.enabled) {
        throw ConfigurationError("a regression CV requires the nn block");
    }
    return cfg;
}

[[nodiscard]] PipelineSlots build_slots(const RegressionConfig& cfg) {
    PipelineSlots slots;
    if (cfg.norm_in.enabled) {
        slots.norm_in.emplace(cfg.layers.front(), cfg.norm_in.options);
    }
    slots.nn.emplace(cfg.layers, cfg.nn.options);
    return slots;
}

[[nodiscard]] RegressionConfig layers_config(std::vector<Eigen::Index> layers) {
    RegressionConfig cfg;
    cfg.layers = std::move(layers);
    return cfg;
}

void check_same_shape(const Matrix& outputs, const Matrix& targets) {
    if (outputs.size() == 0 || outputs.rows() != targets.rows() ||
        outputs.cols() != targets.cols()) {
        throw ShapeMismatchError(fmt::format(
            "regression outputs are {}x{} but targets are {}x{}",
            outputs.rows(), outputs.cols(), targets.rows(), targets.cols()));
    }
}

} // anonymous namespace

// ─── Constructors ─────────────────────────────────────────────────────────────

RegressionCV::RegressionCV(RegressionConfig config)
    : config_(validated(std::move(config))),
      pipeline_(build_slots(config_)) {}

RegressionCV::RegressionCV(std::vector<Eigen::Index> layers)
    : RegressionCV(layers_config(std::move(layers))) {}

// ─── Training step ────────────────────────────────────────────────────────────

double RegressionCV::training_step(const LabeledBatch& batch, std::size_t /*batch_idx*/) {
    const double value = step(batch);
    if (is_training()) {
        ++global_step_;
    }
    return value;
}

double RegressionCV::validation_step(const LabeledBatch& batch, std::size_t /*batch_idx*/) {
    return step(batch);
}

double RegressionCV::step(const LabeledBatch& batch) {
    if (batch.labels.rows() != batch.data.rows() || batch.labels.cols() != out_features()) {
        throw ShapeMismatchError(fmt::format(
            "labels are {}x{}, expected {}x{} for this batch",
            batch.labels.rows(), batch.labels.cols(), batch.data.rows(), out_features()));
    }

    CVPipeline::NnTape tape;
    const Matrix y = pipeline_.forward_nn(batch.data, tape);
    const double value = loss_function(y, batch.labels);

    const bool training = is_training();
    if (training) {
        // d/dy mean((y − t)²)
        const Matrix grad = (2.0 / static_cast<double>(y.size())) * (y - batch.labels);
        pipeline_.backward_nn(tape, grad);
    }

    if (metrics_) {
        metrics_->record(std::string(training ? "train" : "valid") + "_loss", value,
                         global_step_);
    }
    log::debug("{} step {}: mse {:.6f}", training ? "train" : "valid", global_step_, value);
    return value;
}

double RegressionCV::loss_function(const Matrix& outputs, const Matrix& targets) const {
    check_same_shape(outputs, targets);
    return (outputs - targets).squaredNorm() / static_cast<double>(outputs.size());
}

// ─── Parameters and optimizer ─────────────────────────────────────────────────

blocks::ParameterList RegressionCV::parameters() {
    return pipeline_.nn()->parameters();
}

std::unique_ptr<train::Optimizer> RegressionCV::configure_optimizers() {
    return std::make_unique<train::Adam>(
        parameters(), train::AdamOptions{.learning_rate = config_.learning_rate});
}

} // namespace mlcv::cv
