#pragma once

/// @file include/mlcv/deeptica.hpp
/// @brief DeepTicaCV — neural-network TICA collective variable.
///
/// # Module: DeepTICA CV
///
/// ## Responsibility
/// Compose a CVPipeline (normIn → nn → tica → normOut) with the Trainable
/// capability. The network is trained to maximize the autocorrelation of
/// its outputs: the loss is −reduce(eigenvalues) of TICA solved on the
/// network features of (x_t, x_lag).
///
/// ## Training step
///   1. f_t = nn(normIn(x_t)), f_lag = nn(normIn(x_lag))  (shared weights)
///   2. λ, V = tica.compute((f_t, f_lag, w_t, w_lag), save_params = true)
///   3. loss = −reduce(λ; loss options)
///   4. training mode: backpropagate into the nn parameters, then run one
///      full forward on x_t (result discarded) so normOut sees the outputs
///   5. record `{train|valid}_loss` and `{train|valid}_eigval_{i}`
///
/// ## Configuration errors
/// Raised by the constructor before any parameter is allocated: fewer than
/// two layer sizes, out_features outside [1, layers.back()], or a disabled
/// nn or tica slot.
///
/// # Example
/// ```cpp
/// mlcv::cv::DeepTicaCV model({2, 10, 10, 2}, 1);
/// mlcv::train::Trainer trainer({.max_epochs = 1});
/// trainer.fit(model, datamodule);
/// mlcv::Matrix s = model.forward(x);   // (N, 1)
/// ```

#include "mlcv/config.hpp"
#include "mlcv/pipeline.hpp"
#include "mlcv/trace.hpp"
#include "mlcv/trainable.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace mlcv::cv {

class DeepTicaCV final : public train::Trainable {
public:
    explicit DeepTicaCV(ModelConfig config);

    /// Default blocks for the given network; out_features defaults to
    /// layers.back().
    explicit DeepTicaCV(std::vector<Eigen::Index> layers,
                        std::optional<Eigen::Index> out_features = std::nullopt);

    /// CV values, shape (batch, out_features).
    [[nodiscard]] Matrix forward(const Matrix& x) { return pipeline_.forward(x); }

    /// normIn and nn only.
    [[nodiscard]] Matrix forward_nn(const Matrix& x) { return pipeline_.forward_nn(x); }

    double training_step(const TimeLagBatch& batch, std::size_t batch_idx) override;
    double validation_step(const TimeLagBatch& batch, std::size_t batch_idx) override;

    [[nodiscard]] std::unique_ptr<train::Optimizer> configure_optimizers() override;

    /// −reduce(eigenvalues) under the current loss options.
    [[nodiscard]] double loss_function(const Vector& eigenvalues) const override;

    [[nodiscard]] blocks::ParameterList parameters() override;
    void zero_grad();

    void set_training(bool training) override { pipeline_.set_training(training); }
    [[nodiscard]] bool is_training() const noexcept override { return pipeline_.is_training(); }

    void set_metrics(std::shared_ptr<core::MetricsSink> sink) override { metrics_ = std::move(sink); }

    void on_train_epoch_start() override { pipeline_.on_train_epoch_start(); }
    void on_train_epoch_end() override { pipeline_.on_train_epoch_end(); }
    void on_validation_epoch_start() override { pipeline_.on_validation_epoch_start(); }
    void on_validation_epoch_end() override { pipeline_.on_validation_epoch_end(); }

    /// Set C(0) regularization for subsequent TICA solves.
    void set_regularization(double c0_reg = constants::DEFAULT_REG_C0);

    void set_loss_options(loss::LossOptions options) { config_.loss = options; }
    [[nodiscard]] const loss::LossOptions& loss_options() const noexcept { return config_.loss; }

    /// Frozen copy of the current forward map.
    [[nodiscard]] TracedModel trace() const { return pipeline_.trace(); }

    [[nodiscard]] CVPipeline& pipeline() noexcept { return pipeline_; }
    [[nodiscard]] const CVPipeline& pipeline() const noexcept { return pipeline_; }
    [[nodiscard]] const ModelConfig& config() const noexcept { return config_; }

    [[nodiscard]] Eigen::Index in_features() const noexcept { return pipeline_.in_features(); }
    [[nodiscard]] Eigen::Index out_features() const noexcept { return pipeline_.out_features(); }

    /// Training steps taken so far.
    [[nodiscard]] std::size_t global_step() const noexcept { return global_step_; }

private:
    [[nodiscard]] double step(const TimeLagBatch& batch);

    ModelConfig                        config_;
    CVPipeline                         pipeline_;
    std::shared_ptr<core::MetricsSink> metrics_;
    std::size_t                        global_step_ = 0;
};

} // namespace mlcv::cv
