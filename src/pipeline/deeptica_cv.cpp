/// @file src/pipeline/deeptica_cv.cpp
/// @brief DeepTicaCV — slot construction, training step, optimizer.

#include "mlcv/deeptica.hpp"
#include "mlcv/errors.hpp"
#include "mlcv/log.hpp"
#include "mlcv/loss.hpp"

#include <fmt/core.h>

#include <string>

namespace mlcv::cv {

// ─── Internal helpers ─────────────────────────────────────────────────────────

namespace {

/// Check the configuration and fill in out_features. Runs before any block
/// is built.
[[nodiscard]] ModelConfig validated(ModelConfig cfg) {
    if (cfg.layers.size() < 2) {
        throw ConfigurationError(fmt::format(
            "DeepTICA needs at least 2 layer sizes (input and output), got {}",
            cfg.layers.size()));
    }
    if (!cfg.nn.enabled || !cfg.tica.enabled) {
        throw ConfigurationError("DeepTICA requires both the nn and tica blocks");
    }
    const Eigen::Index n_out = cfg.out_features.value_or(cfg.layers.back());
    if (n_out < 1 || n_out > cfg.layers.back()) {
        throw ConfigurationError(fmt::format(
            "out_features = {} must lie in [1, {}] (the last nn layer)",
            n_out, cfg.layers.back()));
    }
    cfg.out_features = n_out;
    return cfg;
}

[[nodiscard]] PipelineSlots build_slots(const ModelConfig& cfg) {
    const Eigen::Index n_in  = cfg.layers.front();
    const Eigen::Index n_out = *cfg.out_features;

    PipelineSlots slots;
    if (cfg.norm_in.enabled) {
        slots.norm_in.emplace(n_in, cfg.norm_in.options);
    }
    slots.nn.emplace(cfg.layers, cfg.nn.options);
    slots.tica.emplace(cfg.layers.back(), n_out, cfg.tica.options);
    if (cfg.norm_out.enabled) {
        slots.norm_out.emplace(n_out, cfg.norm_out.options);
    }
    return slots;
}

[[nodiscard]] ModelConfig layers_config(std::vector<Eigen::Index> layers,
                                        std::optional<Eigen::Index> out_features) {
    ModelConfig cfg;
    cfg.layers       = std::move(layers);
    cfg.out_features = out_features;
    return cfg;
}

} // anonymous namespace

// ─── Constructors ─────────────────────────────────────────────────────────────

DeepTicaCV::DeepTicaCV(ModelConfig config)
    : config_(validated(std::move(config))),
      pipeline_(build_slots(config_)) {}

DeepTicaCV::DeepTicaCV(std::vector<Eigen::Index> layers,
                       std::optional<Eigen::Index> out_features)
    : DeepTicaCV(layers_config(std::move(layers), out_features)) {}

// ─── Training step ────────────────────────────────────────────────────────────

double DeepTicaCV::training_step(const TimeLagBatch& batch, std::size_t /*batch_idx*/) {
    const double value = step(batch);
    if (is_training()) {
        ++global_step_;
    }
    return value;
}

double DeepTicaCV::validation_step(const TimeLagBatch& batch, std::size_t /*batch_idx*/) {
    return step(batch);
}

double DeepTicaCV::step(const TimeLagBatch& batch) {
    CVPipeline::NnTape tape_t;
    CVPipeline::NnTape tape_lag;
    const Matrix f_t   = pipeline_.forward_nn(batch.data, tape_t);
    const Matrix f_lag = pipeline_.forward_nn(batch.data_lag, tape_lag);

    tica::TicaEngine& engine = *pipeline_.tica();
    const EigenDecomposition eig = engine.compute(
        TimeLagPair{
            .x_t   = f_t,
            .x_lag = f_lag,
            .w_t   = batch.weights,
            .w_lag = batch.weights_lag,
        },
        /*save_params=*/true);

    const double value = loss_function(eig.eigenvalues);

    const bool training = is_training();
    if (training) {
        const Vector grad = -loss::EigenvalueReducer::gradient(eig.eigenvalues, config_.loss);
        const stats::FeatureGradient features = engine.backward(grad);
        pipeline_.backward_nn(tape_t, features.x_t);
        pipeline_.backward_nn(tape_lag, features.x_lag);

        // Accumulate normOut statistics on the current outputs.
        static_cast<void>(pipeline_.forward(batch.data));
    }

    if (metrics_) {
        const std::string name = training ? "train" : "valid";
        metrics_->record(name + "_loss", value, global_step_);
        for (Eigen::Index i = 0; i < eig.eigenvalues.size(); ++i) {
            metrics_->record(fmt::format("{}_eigval_{}", name, i + 1),
                             eig.eigenvalues(i), global_step_);
        }
    }
    log::debug("{} step {}: loss {:.6f}", training ? "train" : "valid", global_step_, value);
    return value;
}

double DeepTicaCV::loss_function(const Vector& eigenvalues) const {
    return -loss::EigenvalueReducer::reduce(eigenvalues, config_.loss);
}

// ─── Parameters and optimizer ─────────────────────────────────────────────────

blocks::ParameterList DeepTicaCV::parameters() {
    return pipeline_.nn()->parameters();
}

void DeepTicaCV::zero_grad() {
    pipeline_.nn()->zero_grad();
}

std::unique_ptr<train::Optimizer> DeepTicaCV::configure_optimizers() {
    return std::make_unique<train::Adam>(
        parameters(), train::AdamOptions{.learning_rate = config_.learning_rate});
}

void DeepTicaCV::set_regularization(double c0_reg) {
    pipeline_.tica()->set_regularization(c0_reg);
    config_.tica.options.reg_c0 = c0_reg;
}

} // namespace mlcv::cv
