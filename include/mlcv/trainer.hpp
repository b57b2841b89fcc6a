#pragma once

/// @file include/mlcv/trainer.hpp
/// @brief Trainer — epoch loop over a data module for any Trainable.
///
/// Per epoch:
///   on_train_epoch_start → [zero_grad, training_step, optimizer step] per
///   batch → on_train_epoch_end → (if validation data) on_validation_epoch_start
///   → validation_step per batch → on_validation_epoch_end → epoch means
///
/// The model is left in evaluation mode after `fit`, with the caller's
/// metrics sink reinstalled, also when a step throws.

#include "mlcv/dataset.hpp"
#include "mlcv/metrics.hpp"
#include "mlcv/trainable.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mlcv::train {

struct TrainerOptions {
    std::size_t                        max_epochs = 1;
    std::shared_ptr<core::MetricsSink> metrics;  ///< Optional step/epoch records
};

/// Summary of one `fit` call.
struct FitResult {
    std::size_t         epochs = 0;
    std::size_t         steps  = 0;
    std::vector<double> train_loss;  ///< Mean training loss per epoch
    std::vector<double> valid_loss;  ///< Mean validation loss per epoch (if any)

    /// Last epoch's means of every recorded metric, by name.
    std::map<std::string, double> last_epoch;

    [[nodiscard]] std::string to_string() const;
};

class Trainer {
public:
    /// Throws `ConfigurationError` if max_epochs == 0.
    explicit Trainer(TrainerOptions options = {});

    /// Train `model` on `data`. Errors raised by the model propagate.
    template <typename Batch, typename... LossArgs>
    FitResult fit(BasicTrainable<Batch, LossArgs...>& model,
                  core::BasicDataModule<Batch>& data);

    [[nodiscard]] const TrainerOptions& options() const noexcept { return options_; }

private:
    TrainerOptions options_;
};

extern template FitResult Trainer::fit(Trainable&, core::DataModule&);
extern template FitResult Trainer::fit(LabeledTrainable&, core::LabeledDataModule&);

} // namespace mlcv::train
