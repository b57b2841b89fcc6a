#pragma once

/// @file include/mlcv/regression.hpp
/// @brief RegressionCV — collective variable fitted to a target function.
///
/// # Module: Regression CV
///
/// ## Responsibility
/// Compose a CVPipeline holding only the normIn and nn slots with the
/// LabeledTrainable capability. The network is trained to reproduce given
/// target values; the loss is the mean squared error over every output
/// entry of the batch.
///
/// ## Training step
///   1. y = nn(normIn(x))
///   2. loss = mean((y − labels)²)
///   3. training mode: backpropagate 2(y − labels)/(rows · cols) into the
///      nn parameters
///   4. record `{train|valid}_loss`
///
/// ## Configuration errors
/// Raised by the constructor: fewer than two layer sizes or a disabled nn.
///
/// # Example
/// ```cpp
/// mlcv::cv::RegressionCV model({2, 5, 10, 1});
/// mlcv::core::LabeledDataModule data(mlcv::core::build_labeled_dataset(x, y));
/// mlcv::train::Trainer({.max_epochs = 2}).fit(model, data);
/// mlcv::Matrix s = model.forward(x);   // (N, 1)
/// ```

#include "mlcv/config.hpp"
#include "mlcv/pipeline.hpp"
#include "mlcv/trace.hpp"
#include "mlcv/trainable.hpp"

#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

namespace mlcv::cv {

struct RegressionConfig {
    std::vector<Eigen::Index> layers;  ///< nn sizes incl. input and output

    BlockOption<blocks::NormalizationOptions> norm_in;
    BlockOption<blocks::FeedForwardOptions>   nn;

    double learning_rate = constants::DEFAULT_LEARNING_RATE;
};

class RegressionCV final : public train::LabeledTrainable {
public:
    explicit RegressionCV(RegressionConfig config);

    /// Default blocks for the given network.
    explicit RegressionCV(std::vector<Eigen::Index> layers);

    /// CV values, shape (batch, layers.back()).
    [[nodiscard]] Matrix forward(const Matrix& x) { return pipeline_.forward(x); }

    double training_step(const LabeledBatch& batch, std::size_t batch_idx) override;
    double validation_step(const LabeledBatch& batch, std::size_t batch_idx) override;

    [[nodiscard]] std::unique_ptr<train::Optimizer> configure_optimizers() override;

    /// Mean squared error between `outputs` and `targets`.
    /// Throws `ShapeMismatchError` if their shapes differ or are empty.
    [[nodiscard]] double loss_function(const Matrix& outputs,
                                       const Matrix& targets) const override;

    [[nodiscard]] blocks::ParameterList parameters() override;

    void set_training(bool training) override { pipeline_.set_training(training); }
    [[nodiscard]] bool is_training() const noexcept override { return pipeline_.is_training(); }

    void set_metrics(std::shared_ptr<core::MetricsSink> sink) override { metrics_ = std::move(sink); }

    void on_train_epoch_start() override { pipeline_.on_train_epoch_start(); }
    void on_train_epoch_end() override { pipeline_.on_train_epoch_end(); }
    void on_validation_epoch_start() override { pipeline_.on_validation_epoch_start(); }
    void on_validation_epoch_end() override { pipeline_.on_validation_epoch_end(); }

    void set_learning_rate(double lr) { config_.learning_rate = lr; }

    [[nodiscard]] TracedModel trace() const { return pipeline_.trace(); }

    [[nodiscard]] CVPipeline& pipeline() noexcept { return pipeline_; }
    [[nodiscard]] const CVPipeline& pipeline() const noexcept { return pipeline_; }
    [[nodiscard]] const RegressionConfig& config() const noexcept { return config_; }

    [[nodiscard]] Eigen::Index in_features() const noexcept { return pipeline_.in_features(); }
    [[nodiscard]] Eigen::Index out_features() const noexcept { return pipeline_.out_features(); }

    [[nodiscard]] std::size_t global_step() const noexcept { return global_step_; }

private:
    [[nodiscard]] double step(const LabeledBatch& batch);

    RegressionConfig                   config_;
    CVPipeline                         pipeline_;
    std::shared_ptr<core::MetricsSink> metrics_;
    std::size_t                        global_step_ = 0;
};

} // namespace mlcv::cv
