/**
 * @file test_output_capture.cpp
 * @brief Unit tests for console capture
 *
 * @date 2025
 */

#include "evalbox/monitors/output_capture.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using evalbox::core::Json;
using evalbox::core::LogEntry;
using evalbox::core::LogKind;
using evalbox::monitors::BufferedLogSink;
using evalbox::monitors::LogSink;
using evalbox::monitors::OutputCapture;

TEST(OutputCaptureTest, AssignsIncreasingSequenceNumbers) {
    BufferedLogSink sink;
    OutputCapture capture(OutputCapture::Limits{}, sink);

    EXPECT_TRUE(capture.Record(LogKind::LOG, {Json("a")}));
    EXPECT_TRUE(capture.Record(LogKind::WARN, {Json(1), Json(true)}));
    EXPECT_TRUE(capture.Record(LogKind::ERROR, {}));

    const auto& entries = sink.Entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].kind, LogKind::LOG);
    EXPECT_EQ(entries[1].kind, LogKind::WARN);
    EXPECT_EQ(entries[2].kind, LogKind::ERROR);
    for (std::size_t i = 0; i < entries.size(); ++i) {
        EXPECT_EQ(entries[i].sequence_number, i);
        EXPECT_GT(entries[i].timestamp_ms, 0);
    }
    EXPECT_EQ(entries[1].arguments, (std::vector<Json>{Json(1), Json(true)}));
    EXPECT_EQ(capture.Count(), 3u);
    EXPECT_EQ(capture.NextSequence(), 3u);
}

TEST(OutputCaptureTest, DropsEntriesOverCountLimit) {
    BufferedLogSink sink;
    OutputCapture::Limits limits;
    limits.max_entries = 2;
    OutputCapture capture(limits, sink);

    EXPECT_TRUE(capture.Record(LogKind::LOG, {Json(1)}));
    EXPECT_TRUE(capture.Record(LogKind::LOG, {Json(2)}));
    EXPECT_FALSE(capture.Record(LogKind::LOG, {Json(3)}));

    EXPECT_EQ(sink.Entries().size(), 2u);
    EXPECT_EQ(capture.DroppedCount(), 1u);
}

TEST(OutputCaptureTest, DropsEntriesOverByteLimit) {
    BufferedLogSink sink;
    OutputCapture::Limits limits;
    limits.max_bytes = 32;
    OutputCapture capture(limits, sink);

    EXPECT_TRUE(capture.Record(LogKind::LOG, {Json("short")}));
    EXPECT_FALSE(capture.Record(LogKind::LOG, {Json(std::string(64, 'x'))}));
    EXPECT_TRUE(capture.Record(LogKind::LOG, {Json("again")}));

    ASSERT_EQ(sink.Entries().size(), 2u);
    EXPECT_EQ(sink.Entries()[1].sequence_number, 1u);
    EXPECT_LE(capture.Bytes(), 32u);
}

TEST(OutputCaptureTest, TakeEntriesEmptiesSink) {
    BufferedLogSink sink;
    OutputCapture capture(OutputCapture::Limits{}, sink);
    capture.Record(LogKind::INFO, {Json("x")});

    auto taken = sink.TakeEntries();
    EXPECT_EQ(taken.size(), 1u);
    EXPECT_TRUE(sink.Entries().empty());
}

TEST(OutputCaptureTest, ForwardsToCustomSink) {
    class CountingSink : public LogSink {
    public:
        void Emit(const LogEntry& entry) override { kinds.push_back(entry.kind); }
        std::vector<LogKind> kinds;
    };

    CountingSink sink;
    OutputCapture capture(OutputCapture::Limits{}, sink);
    capture.Record(LogKind::INFO, {});
    capture.Record(LogKind::ERROR, {});

    EXPECT_EQ(sink.kinds, (std::vector<LogKind>{LogKind::INFO, LogKind::ERROR}));
}
