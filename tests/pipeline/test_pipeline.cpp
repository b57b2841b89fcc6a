/// @file tests/pipeline/test_pipeline.cpp
/// @brief Unit tests for CVPipeline and TracedModel.
///
/// Test categories:
///   - Empty slots are the identity
///   - Width checks at construction
///   - Training flag and epoch hooks reach every block
///   - backward_nn through normIn
///   - trace() reproduces forward()

#include <gtest/gtest.h>
#include "mlcv/errors.hpp"
#include "mlcv/pipeline.hpp"

#include <random>
#include <utility>

using namespace mlcv;
using namespace mlcv::cv;
using mlcv::blocks::Activation;
using mlcv::blocks::FeedForwardBlock;
using mlcv::blocks::FeedForwardOptions;
using mlcv::blocks::NormalizationBlock;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static Matrix random_matrix(Eigen::Index rows, Eigen::Index cols, unsigned seed) {
    std::mt19937_64 rng(seed);
    std::normal_distribution<double> dist(0.0, 1.0);
    Matrix m(rows, cols);
    for (Eigen::Index i = 0; i < rows; ++i) {
        for (Eigen::Index j = 0; j < cols; ++j) {
            m(i, j) = dist(rng);
        }
    }
    return m;
}

static FeedForwardOptions tanh_options() {
    return FeedForwardOptions{.activation = Activation::Tanh, .seed = 3};
}

/// normIn(2) → nn(2, 5, 3) → tica(3 → 2) → normOut(2)
static PipelineSlots full_slots() {
    PipelineSlots slots;
    slots.norm_in.emplace(2);
    slots.nn.emplace(std::vector<Eigen::Index>{2, 5, 3}, tanh_options());
    slots.tica.emplace(3, 2);
    slots.norm_out.emplace(2);
    return slots;
}

static void train_epoch(CVPipeline& pipeline, const Matrix& x) {
    pipeline.set_training(true);
    pipeline.on_train_epoch_start();
    static_cast<void>(pipeline.forward(x));
    pipeline.on_train_epoch_end();
    pipeline.set_training(false);
}

// ─── Slots ───────────────────────────────────────────────────────────────────

TEST(CVPipeline, NnOnlyPipelineIsTheNetwork) {
    PipelineSlots slots;
    slots.nn.emplace(std::vector<Eigen::Index>{3, 4, 2}, tanh_options());
    CVPipeline pipeline(std::move(slots));
    FeedForwardBlock reference({3, 4, 2}, tanh_options());

    const Matrix x = random_matrix(6, 3, 1);
    EXPECT_TRUE(pipeline.forward(x).isApprox(reference.forward(x)));
    EXPECT_EQ(pipeline.present_blocks().size(), 1u);
    EXPECT_EQ(pipeline.norm_in(), nullptr);
    EXPECT_EQ(pipeline.tica(), nullptr);
    EXPECT_EQ(pipeline.in_features(), 3);
    EXPECT_EQ(pipeline.out_features(), 2);
}

TEST(CVPipeline, PresentBlocksInSlotOrder) {
    CVPipeline pipeline(full_slots());
    const auto blocks = pipeline.present_blocks();
    ASSERT_EQ(blocks.size(), 4u);
    EXPECT_EQ(blocks[0]->kind(), pipeline.norm_in()->kind());
    EXPECT_EQ(blocks[1]->kind(), "feedforward");
    EXPECT_EQ(blocks[2]->kind(), "tica");
    EXPECT_EQ(pipeline.in_features(), 2);
    EXPECT_EQ(pipeline.out_features(), 2);
}

TEST(CVPipeline, ForwardNnStopsBeforeTica) {
    CVPipeline pipeline(full_slots());
    const Matrix x = random_matrix(5, 2, 2);
    const Matrix features = pipeline.forward_nn(x);
    EXPECT_EQ(features.cols(), 3);
    // Untrained normalizations are identities; TICA starts on the leading axes.
    EXPECT_TRUE(pipeline.forward(x).isApprox(features.leftCols(2)));
}

// ─── Construction errors ─────────────────────────────────────────────────────

TEST(CVPipeline, RejectsEmptyPipeline) {
    EXPECT_THROW(CVPipeline(PipelineSlots{}), ConfigurationError);
}

TEST(CVPipeline, RejectsWidthMismatch) {
    PipelineSlots slots;
    slots.nn.emplace(std::vector<Eigen::Index>{2, 4, 3});
    slots.tica.emplace(2, 1);
    EXPECT_THROW(CVPipeline(std::move(slots)), ConfigurationError);

    PipelineSlots norm;
    norm.norm_in.emplace(3);
    norm.nn.emplace(std::vector<Eigen::Index>{2, 2});
    EXPECT_THROW(CVPipeline(std::move(norm)), ConfigurationError);
}

// ─── Mode and hooks ──────────────────────────────────────────────────────────

TEST(CVPipeline, TrainingFlagReachesEveryBlock) {
    CVPipeline pipeline(full_slots());
    EXPECT_FALSE(pipeline.is_training());
    pipeline.set_training(true);
    EXPECT_TRUE(pipeline.is_training());
    for (const auto* b : std::as_const(pipeline).present_blocks()) {
        EXPECT_TRUE(b->is_training()) << b->kind();
    }
    pipeline.set_training(false);
    for (const auto* b : std::as_const(pipeline).present_blocks()) {
        EXPECT_FALSE(b->is_training()) << b->kind();
    }
}

TEST(CVPipeline, EpochHooksUpdateNormalizationStatistics) {
    CVPipeline pipeline(full_slots());
    Matrix x = random_matrix(40, 2, 4);
    x.col(0).array() += 5.0;
    train_epoch(pipeline, x);

    EXPECT_NEAR(pipeline.norm_in()->mean()(0), x.col(0).mean(), 1e-12);
    EXPECT_GT(pipeline.norm_out()->samples_seen(), 0.0);
    const Matrix normalized = pipeline.norm_in()->forward(x);
    EXPECT_NEAR(normalized.col(0).mean(), 0.0, 1e-12);
}

// ─── Gradient ────────────────────────────────────────────────────────────────

TEST(CVPipeline, BackwardNnMatchesFiniteDifferences) {
    PipelineSlots slots;
    slots.norm_in.emplace(2);
    slots.nn.emplace(std::vector<Eigen::Index>{2, 4, 2}, tanh_options());
    CVPipeline pipeline(std::move(slots));

    RowVector mean(2);
    RowVector range(2);
    mean << 0.5, -1.0;
    range << 2.0, 0.25;
    pipeline.norm_in()->set_params(mean, range);

    const Matrix x = random_matrix(3, 2, 5);
    const Matrix g = random_matrix(3, 2, 6);

    CVPipeline::NnTape tape;
    static_cast<void>(pipeline.forward_nn(x, tape));
    const Matrix dx = pipeline.backward_nn(tape, g);

    const double h = 1e-6;
    for (Eigen::Index i = 0; i < x.rows(); ++i) {
        for (Eigen::Index j = 0; j < x.cols(); ++j) {
            Matrix up = x;
            Matrix down = x;
            up(i, j) += h;
            down(i, j) -= h;
            const double fd = (pipeline.forward_nn(up).cwiseProduct(g).sum()
                               - pipeline.forward_nn(down).cwiseProduct(g).sum()) / (2.0 * h);
            EXPECT_NEAR(dx(i, j), fd, 1e-5);
        }
    }
}

// ─── Trace ───────────────────────────────────────────────────────────────────

TEST(CVPipeline, TraceReproducesForward) {
    CVPipeline pipeline(full_slots());
    const Matrix x = random_matrix(30, 2, 7);
    train_epoch(pipeline, x);

    TimeLagPair pair{
        .x_t   = pipeline.forward_nn(x.topRows(29)),
        .x_lag = pipeline.forward_nn(x.bottomRows(29)),
        .w_t   = uniform_weights(29),
        .w_lag = uniform_weights(29),
    };
    static_cast<void>(pipeline.tica()->compute(pair, true));

    const TracedModel traced = pipeline.trace();
    EXPECT_EQ(traced.in_features(), 2);
    EXPECT_EQ(traced.out_features(), 2);
    // Standardize, Affine, Activate, Affine, Affine (tica), Standardize
    EXPECT_EQ(traced.ops().size(), 6u);

    const Matrix probe = random_matrix(8, 2, 8);
    EXPECT_TRUE(traced.forward(probe).isApprox(pipeline.forward(probe), 1e-12));
    EXPECT_FALSE(traced.to_string().empty());
}

TEST(TracedModel, RejectsInconsistentOps) {
    std::vector<TracedOp> ops;
    ops.emplace_back(Affine{.a = Matrix::Ones(2, 3), .b = RowVector::Zero(3)});
    ops.emplace_back(Affine{.a = Matrix::Ones(2, 1), .b = RowVector::Zero(1)});
    EXPECT_THROW(TracedModel(2, std::move(ops)), ConfigurationError);
}

TEST(TracedModel, RejectsWrongInputWidth) {
    std::vector<TracedOp> ops;
    ops.emplace_back(Activate{.activation = Activation::Tanh});
    const TracedModel traced(3, std::move(ops));
    EXPECT_EQ(traced.out_features(), 3);
    EXPECT_THROW(static_cast<void>(traced.forward(Matrix::Ones(2, 2))), ShapeMismatchError);
}
