#pragma once

/// @file include/mlcv/pipeline.hpp
/// @brief CVPipeline — the fixed normIn → nn → tica → normOut block chain.
///
/// # Module: CV Pipeline
///
/// ## Responsibility
/// Own up to four blocks in fixed slots and apply the present ones in slot
/// order. An empty slot is the identity. Adjacent present blocks must agree
/// on their feature widths; this is checked at construction, before any
/// batch is seen.
///
/// Lifecycle hooks and the training flag are forwarded to every present
/// block in slot order.
///
/// ## NOT Responsible For
/// - Training-step logic and losses (see include/mlcv/deeptica.hpp)

#include "mlcv/blocks.hpp"
#include "mlcv/feedforward.hpp"
#include "mlcv/normalization.hpp"
#include "mlcv/tica.hpp"
#include "mlcv/trace.hpp"

#include <optional>
#include <vector>

namespace mlcv::cv {

struct PipelineSlots {
    std::optional<blocks::NormalizationBlock> norm_in;
    std::optional<blocks::FeedForwardBlock>   nn;
    std::optional<mlcv::tica::TicaEngine>     tica;
    std::optional<blocks::NormalizationBlock> norm_out;
};

class CVPipeline : public blocks::Lifecycle {
public:
    /// Record of one `forward_nn` call, needed by `backward_nn`.
    struct NnTape {
        blocks::FeedForwardBlock::Tape nn;
    };

    /// Throws `ConfigurationError` if every slot is empty or two adjacent
    /// present blocks disagree on their feature width.
    explicit CVPipeline(PipelineSlots slots);

    /// Apply all present blocks.
    [[nodiscard]] Matrix forward(const Matrix& x);

    /// Apply normIn and nn only (the featurizer).
    [[nodiscard]] Matrix forward_nn(const Matrix& x);

    /// As above, recording what `backward_nn` needs.
    [[nodiscard]] Matrix forward_nn(const Matrix& x, NnTape& tape);

    /// Accumulate nn parameter gradients for the call recorded in `tape`
    /// and return dL/dx with respect to the raw input. normIn statistics are
    /// treated as constants.
    Matrix backward_nn(const NnTape& tape, const Matrix& grad_features);

    /// Freeze the present blocks into a flat op list.
    [[nodiscard]] TracedModel trace() const;

    void set_training(bool training);
    [[nodiscard]] bool is_training() const noexcept { return training_; }

    void on_train_epoch_start() override;
    void on_train_epoch_end() override;
    void on_validation_epoch_start() override;
    void on_validation_epoch_end() override;

    [[nodiscard]] Eigen::Index in_features() const noexcept;
    [[nodiscard]] Eigen::Index out_features() const noexcept;

    /// Present blocks in slot order.
    [[nodiscard]] std::vector<blocks::Block*> present_blocks();
    [[nodiscard]] std::vector<const blocks::Block*> present_blocks() const;

    [[nodiscard]] blocks::NormalizationBlock* norm_in() noexcept { return slot(slots_.norm_in); }
    [[nodiscard]] blocks::FeedForwardBlock*   nn() noexcept { return slot(slots_.nn); }
    [[nodiscard]] mlcv::tica::TicaEngine*     tica() noexcept { return slot(slots_.tica); }
    [[nodiscard]] blocks::NormalizationBlock* norm_out() noexcept { return slot(slots_.norm_out); }

    [[nodiscard]] const blocks::NormalizationBlock* norm_in() const noexcept { return slot(slots_.norm_in); }
    [[nodiscard]] const blocks::FeedForwardBlock*   nn() const noexcept { return slot(slots_.nn); }
    [[nodiscard]] const mlcv::tica::TicaEngine*     tica() const noexcept { return slot(slots_.tica); }
    [[nodiscard]] const blocks::NormalizationBlock* norm_out() const noexcept { return slot(slots_.norm_out); }

private:
    template <typename T>
    static T* slot(std::optional<T>& s) noexcept { return s ? &*s : nullptr; }

    template <typename T>
    static const T* slot(const std::optional<T>& s) noexcept { return s ? &*s : nullptr; }

    PipelineSlots slots_;
    bool          training_ = false;
};

} // namespace mlcv::cv
