/// @file tests/core/test_metrics.cpp
/// @brief Unit tests for the metrics sinks.

#include <gtest/gtest.h>
#include "mlcv/metrics.hpp"

#include <cstdio>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace mlcv::core;

// ─── MemorySink ──────────────────────────────────────────────────────────────

TEST(MemorySink, KeepsRecordsInOrder) {
    MemorySink sink;
    sink.record("train_loss", -0.5, 0);
    sink.record("train_eigval_1", 0.7, 0);
    sink.record("train_loss", -0.6, 1);

    ASSERT_EQ(sink.records().size(), 3u);
    EXPECT_EQ(sink.records()[2].step, 1u);
    const auto losses = sink.values("train_loss");
    ASSERT_EQ(losses.size(), 2u);
    EXPECT_DOUBLE_EQ(losses[1], -0.6);
    EXPECT_EQ(sink.last("train_loss"), -0.6);
    EXPECT_TRUE(sink.contains("train_eigval_1"));
    EXPECT_FALSE(sink.contains("valid_loss"));
    EXPECT_FALSE(sink.last("valid_loss").has_value());

    sink.clear();
    EXPECT_TRUE(sink.records().empty());
}

// ─── EpochAverager ───────────────────────────────────────────────────────────

TEST(EpochAverager, ForwardsAndAverages) {
    auto inner = std::make_shared<MemorySink>();
    EpochAverager averager(inner);
    averager.record("train_loss", 1.0, 0);
    averager.record("train_loss", 3.0, 1);
    averager.record("valid_loss", 5.0, 1);

    EXPECT_EQ(inner->values("train_loss").size(), 2u);

    const auto means = averager.flush(0);
    EXPECT_DOUBLE_EQ(means.at("train_loss"), 2.0);
    EXPECT_DOUBLE_EQ(means.at("valid_loss"), 5.0);
    EXPECT_EQ(inner->last("train_loss_epoch"), 2.0);
    EXPECT_EQ(inner->records().back().step, 0u);
}

TEST(EpochAverager, FlushResetsAccumulators) {
    EpochAverager averager(nullptr);
    averager.record("train_loss", 1.0, 0);
    static_cast<void>(averager.flush(0));
    averager.record("train_loss", 7.0, 1);
    const auto means = averager.flush(1);
    EXPECT_DOUBLE_EQ(means.at("train_loss"), 7.0);
    EXPECT_TRUE(averager.flush(2).empty());
}

// ─── ConsoleSink ─────────────────────────────────────────────────────────────

TEST(ConsoleSink, PrintsStepNameAndValueToStderr) {
    ConsoleSink sink;
    testing::internal::CaptureStderr();
    sink.record("train_loss", -0.5, 12);
    const std::string text = testing::internal::GetCapturedStderr();
    EXPECT_NE(text.find("12"), std::string::npos);
    EXPECT_NE(text.find("train_loss"), std::string::npos);
    EXPECT_NE(text.find("-0.500000"), std::string::npos);
}

// ─── CsvSink ─────────────────────────────────────────────────────────────────

TEST(CsvSink, WritesHeaderAndRows) {
    const std::string path = "test_metrics_sink.csv";
    {
        CsvSink sink(path);
        sink.record("train_loss", -0.25, 3);
    }
    std::ifstream in(path);
    std::string header;
    std::string row;
    std::getline(in, header);
    std::getline(in, row);
    in.close();
    std::remove(path.c_str());

    EXPECT_EQ(header, "step,name,value");
    EXPECT_EQ(row, "3,train_loss,-0.25");
}

TEST(CsvSink, UnwritablePathThrows) {
    EXPECT_THROW(CsvSink("/nonexistent/dir/metrics.csv"), std::runtime_error);
}
