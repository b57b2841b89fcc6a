#pragma once

/// @file include/mlcv/trainable.hpp
/// @brief Trainable — what the training loop needs from a model.
///
/// Kept apart from CVPipeline: a pipeline evaluates blocks, a Trainable
/// turns batches into losses and gradients. A concrete model composes both.
///
/// The interface is parameterized by the batch type it trains on and by
/// the arguments of its loss:
///   - `Trainable`         time-lagged batches; the loss reduces eigenvalues
///   - `LabeledTrainable`  labelled batches; the loss compares outputs and
///                         targets

#include "mlcv/blocks.hpp"
#include "mlcv/metrics.hpp"
#include "mlcv/optim.hpp"
#include "mlcv/types.hpp"

#include <cstddef>
#include <memory>

namespace mlcv::train {

template <typename Batch, typename... LossArgs>
class BasicTrainable : public blocks::Lifecycle {
public:
    /// Loss of one training batch. In training mode also accumulates the
    /// parameter gradients of that loss.
    virtual double training_step(const Batch& batch, std::size_t batch_idx) = 0;

    /// Loss of one validation batch; no gradients.
    virtual double validation_step(const Batch& batch, std::size_t batch_idx) = 0;

    /// Optimizer over `parameters()`.
    [[nodiscard]] virtual std::unique_ptr<Optimizer> configure_optimizers() = 0;

    /// Scalar loss from the model's per-batch summary.
    [[nodiscard]] virtual double loss_function(const LossArgs&... args) const = 0;

    [[nodiscard]] virtual blocks::ParameterList parameters() = 0;

    virtual void set_training(bool training) = 0;
    [[nodiscard]] virtual bool is_training() const noexcept = 0;

    /// Destination of step diagnostics; null disables them.
    virtual void set_metrics(std::shared_ptr<core::MetricsSink> sink) = 0;
};

/// Time-lagged models: `loss_function(eigenvalues)`.
using Trainable = BasicTrainable<TimeLagBatch, Vector>;

/// Supervised models: `loss_function(outputs, targets)`.
using LabeledTrainable = BasicTrainable<LabeledBatch, Matrix, Matrix>;

} // namespace mlcv::train
