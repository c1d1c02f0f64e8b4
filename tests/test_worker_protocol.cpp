/**
 * @file test_worker_protocol.cpp
 * @brief Unit tests for the worker result channel
 *
 * @date 2025
 */

#include "evalbox/core/worker_protocol.hpp"

#include <gtest/gtest.h>

#include <fcntl.h>
#include <unistd.h>

#include <csignal>
#include <stdexcept>
#include <string>

using evalbox::core::ChannelLogSink;
using evalbox::core::ErrorCategory;
using evalbox::core::ErrorDetail;
using evalbox::core::Json;
using evalbox::core::LogEntry;
using evalbox::core::LogKind;
using evalbox::core::OutcomeStatus;
using evalbox::core::RawOutcome;
using evalbox::core::WorkerMessage;
using evalbox::core::WorkerProtocol;

namespace {

std::string ReadAvailable(int fd) {
    std::string data;
    char buffer[4096];
    ssize_t n;
    while ((n = read(fd, buffer, sizeof(buffer))) > 0) {
        data.append(buffer, static_cast<std::size_t>(n));
    }
    return data;
}

} // namespace

TEST(WorkerProtocolTest, LogLineCarriesEntry) {
    LogEntry entry;
    entry.kind = LogKind::WARN;
    entry.arguments = {Json("careful"), Json{{"n", 1}}};
    entry.sequence_number = 7;
    entry.timestamp_ms = 1735689600000;

    auto line = WorkerProtocol::EncodeLog(entry);
    EXPECT_EQ(line.find('\n'), std::string::npos);

    auto message = WorkerProtocol::Decode(line);
    EXPECT_EQ(message.type, WorkerMessage::Type::LOG);
    EXPECT_EQ(message.entry.kind, LogKind::WARN);
    EXPECT_EQ(message.entry.arguments, entry.arguments);
    EXPECT_EQ(message.entry.sequence_number, 7u);
    EXPECT_EQ(message.entry.timestamp_ms, 1735689600000);
}

TEST(WorkerProtocolTest, OutcomeKeepsAbsentAndNullValuesApart) {
    RawOutcome absent;
    absent.status = OutcomeStatus::COMPLETED;
    auto decoded_absent = WorkerProtocol::Decode(WorkerProtocol::EncodeOutcome(absent));
    EXPECT_EQ(decoded_absent.type, WorkerMessage::Type::OUTCOME);
    EXPECT_EQ(decoded_absent.outcome.status, OutcomeStatus::COMPLETED);
    EXPECT_FALSE(decoded_absent.outcome.value.has_value());

    RawOutcome null_value;
    null_value.status = OutcomeStatus::COMPLETED;
    null_value.value = Json(nullptr);
    auto decoded_null = WorkerProtocol::Decode(WorkerProtocol::EncodeOutcome(null_value));
    ASSERT_TRUE(decoded_null.outcome.value.has_value());
    EXPECT_TRUE(decoded_null.outcome.value->is_null());
}

TEST(WorkerProtocolTest, OutcomeCarriesError) {
    RawOutcome outcome;
    outcome.status = OutcomeStatus::FAULTED;
    outcome.error = ErrorDetail{ErrorCategory::CAPABILITY_VIOLATION, "x is not defined"};

    auto message = WorkerProtocol::Decode(WorkerProtocol::EncodeOutcome(outcome));
    EXPECT_EQ(message.outcome.status, OutcomeStatus::FAULTED);
    ASSERT_TRUE(message.outcome.error.has_value());
    EXPECT_EQ(message.outcome.error->category, ErrorCategory::CAPABILITY_VIOLATION);
    EXPECT_EQ(message.outcome.error->message, "x is not defined");
}

TEST(WorkerProtocolTest, RejectsMalformedLines) {
    EXPECT_THROW(WorkerProtocol::Decode("not json"), std::runtime_error);
    EXPECT_THROW(WorkerProtocol::Decode("[1,2]"), std::runtime_error);
    EXPECT_THROW(WorkerProtocol::Decode(R"({"type":"bogus"})"), std::runtime_error);
    EXPECT_THROW(WorkerProtocol::Decode(R"({"type":"log","kind":"shout","args":[],"seq":0,"ts":0})"),
                 std::runtime_error);
    EXPECT_THROW(WorkerProtocol::Decode(R"({"type":"log","kind":"log"})"), std::runtime_error);
    EXPECT_THROW(WorkerProtocol::Decode(R"({"type":"outcome","status":"exploded"})"),
                 std::runtime_error);
}

TEST(WorkerProtocolTest, ChannelSinkWritesNewlineFramedLines) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);

    {
        ChannelLogSink sink(fds[1]);
        LogEntry first;
        first.arguments = {Json("one")};
        LogEntry second;
        second.sequence_number = 1;
        second.arguments = {Json("two")};
        sink.Emit(first);
        sink.Emit(second);
        EXPECT_TRUE(sink.Healthy());
    }
    close(fds[1]);

    std::string data = ReadAvailable(fds[0]);
    close(fds[0]);

    auto newline = data.find('\n');
    ASSERT_NE(newline, std::string::npos);
    auto first = WorkerProtocol::Decode(data.substr(0, newline));
    auto second = WorkerProtocol::Decode(data.substr(newline + 1, data.size() - newline - 2));
    EXPECT_EQ(first.entry.arguments[0], "one");
    EXPECT_EQ(second.entry.arguments[0], "two");
    EXPECT_EQ(data.back(), '\n');
}

TEST(WorkerProtocolTest, ChannelSinkTurnsUnhealthyOnClosedPipe) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    close(fds[0]);

    // Writing to a pipe without readers raises SIGPIPE unless ignored
    auto previous = signal(SIGPIPE, SIG_IGN);
    ChannelLogSink sink(fds[1]);
    sink.Emit(LogEntry{});
    EXPECT_FALSE(sink.Healthy());
    signal(SIGPIPE, previous);

    close(fds[1]);
}
