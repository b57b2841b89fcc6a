/// @file src/train/trainer.cpp
/// @brief Trainer epoch loop.

#include "mlcv/trainer.hpp"
#include "mlcv/errors.hpp"
#include "mlcv/log.hpp"

#include <fmt/format.h>

#include <utility>

namespace mlcv::train {

// ─── Internal helpers ─────────────────────────────────────────────────────────

namespace {

/// Puts the model back in evaluation mode with the caller's sink when `fit`
/// returns or unwinds.
template <typename Model>
class FitScope {
public:
    FitScope(Model& model, std::shared_ptr<core::MetricsSink> restore)
        : model_(model), restore_(std::move(restore)) {}

    FitScope(const FitScope&)            = delete;
    FitScope& operator=(const FitScope&) = delete;

    ~FitScope() {
        model_.set_training(false);
        model_.set_metrics(std::move(restore_));
    }

private:
    Model&                             model_;
    std::shared_ptr<core::MetricsSink> restore_;
};

} // anonymous namespace

std::string FitResult::to_string() const {
    std::string out = fmt::format(
        "=== Training Summary ===\n"
        "  Epochs:            {}\n"
        "  Optimizer steps:   {}\n",
        epochs, steps);
    if (!train_loss.empty()) {
        out += fmt::format("  Final train loss:  {:.6f}\n", train_loss.back());
    }
    if (!valid_loss.empty()) {
        out += fmt::format("  Final valid loss:  {:.6f}\n", valid_loss.back());
    }
    for (const auto& [name, value] : last_epoch) {
        out += fmt::format("  {:<18} {:.6f}\n", name + ":", value);
    }
    return out;
}

Trainer::Trainer(TrainerOptions options) : options_(std::move(options)) {
    if (options_.max_epochs == 0) {
        throw ConfigurationError("max_epochs must be >= 1");
    }
}

template <typename Batch, typename... LossArgs>
FitResult Trainer::fit(BasicTrainable<Batch, LossArgs...>& model,
                       core::BasicDataModule<Batch>& data) {
    using Model = BasicTrainable<Batch, LossArgs...>;

    auto averager = std::make_shared<core::EpochAverager>(options_.metrics);
    const FitScope<Model> scope(model, options_.metrics);
    model.set_metrics(averager);

    std::unique_ptr<Optimizer> optimizer = model.configure_optimizers();
    FitResult result;

    for (std::size_t epoch = 0; epoch < options_.max_epochs; ++epoch) {
        // ── training ──
        model.set_training(true);
        model.on_train_epoch_start();

        const std::vector<Batch> batches = data.train_batches();
        double loss_sum = 0.0;
        for (std::size_t i = 0; i < batches.size(); ++i) {
            optimizer->zero_grad();
            loss_sum += model.training_step(batches[i], i);
            optimizer->step();
            ++result.steps;
        }
        model.on_train_epoch_end();
        if (!batches.empty()) {
            result.train_loss.push_back(loss_sum / static_cast<double>(batches.size()));
        }

        // ── validation ──
        const std::vector<Batch> valid = data.valid_batches();
        if (!valid.empty()) {
            model.set_training(false);
            model.on_validation_epoch_start();
            double valid_sum = 0.0;
            for (std::size_t i = 0; i < valid.size(); ++i) {
                valid_sum += model.validation_step(valid[i], i);
            }
            model.on_validation_epoch_end();
            result.valid_loss.push_back(valid_sum / static_cast<double>(valid.size()));
        }

        result.last_epoch = averager->flush(epoch);
        ++result.epochs;
        log::info("epoch {}/{}: train loss {:.6f}{}", epoch + 1, options_.max_epochs,
                  result.train_loss.empty() ? 0.0 : result.train_loss.back(),
                  result.valid_loss.empty()
                      ? std::string()
                      : fmt::format(", valid loss {:.6f}", result.valid_loss.back()));
    }

    return result;
}

template FitResult Trainer::fit(Trainable&, core::DataModule&);
template FitResult Trainer::fit(LabeledTrainable&, core::LabeledDataModule&);

} // namespace mlcv::train
