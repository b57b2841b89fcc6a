#pragma once

/// @file include/mlcv/blocks.hpp
/// @brief Block and Lifecycle capability interfaces shared by all pipeline
///        stages, plus the trainable Parameter record.
///
/// A Block maps a (batch, in_features) matrix to (batch, out_features). In
/// training mode a block may also accumulate statistics from the batches it
/// sees; the numerical result of `forward` is identical in both modes.
///
/// Lifecycle hooks are invoked explicitly by the owning pipeline on each
/// present block, in slot order. Blocks override only the hooks they need.

#include "mlcv/types.hpp"

#include <functional>
#include <string_view>
#include <vector>

namespace mlcv::blocks {

// ─── Parameter ────────────────────────────────────────────────────────────────

/// A trainable tensor and its accumulated loss gradient (same shape).
struct Parameter {
    Matrix value;
    Matrix grad;

    /// Reset the gradient to zeros shaped like `value`.
    void zero_grad() { grad.setZero(value.rows(), value.cols()); }
};

/// Non-owning views of the parameters of a model, in a stable order.
using ParameterList = std::vector<std::reference_wrapper<Parameter>>;

// ─── Lifecycle ────────────────────────────────────────────────────────────────

/// Epoch-level hooks driven by the training loop.
class Lifecycle {
public:
    virtual ~Lifecycle() = default;

    virtual void on_train_epoch_start() {}
    virtual void on_train_epoch_end() {}
    virtual void on_validation_epoch_start() {}
    virtual void on_validation_epoch_end() {}
};

// ─── Block ────────────────────────────────────────────────────────────────────

/// One stage of a CV pipeline.
///
/// Blocks start in evaluation mode; the pipeline switches them with
/// `set_training`.
class Block : public Lifecycle {
public:
    /// Apply the block to a batch. Throws `ShapeMismatchError` if
    /// x.cols() != in_features().
    [[nodiscard]] virtual Matrix forward(const Matrix& x) = 0;

    [[nodiscard]] virtual Eigen::Index in_features() const noexcept = 0;
    [[nodiscard]] virtual Eigen::Index out_features() const noexcept = 0;

    /// Short type tag used in error messages and traces.
    [[nodiscard]] virtual std::string_view kind() const noexcept = 0;

    void set_training(bool training) noexcept { training_ = training; }
    [[nodiscard]] bool is_training() const noexcept { return training_; }

protected:
    /// Throw `ShapeMismatchError` unless x has in_features() columns.
    void check_input(const Matrix& x) const;

private:
    bool training_ = false;
};

} // namespace mlcv::blocks
