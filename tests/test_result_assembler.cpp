/**
 * @file test_result_assembler.cpp
 * @brief Unit tests for result assembly and the wire format
 *
 * @date 2025
 */

#include "evalbox/reporters/result_assembler.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <vector>

using evalbox::core::ErrorCategory;
using evalbox::core::ErrorDetail;
using evalbox::core::HostReport;
using evalbox::core::Json;
using evalbox::core::LogEntry;
using evalbox::core::LogKind;
using evalbox::core::OutcomeStatus;
using evalbox::core::RawOutcome;
using evalbox::reporters::ResultAssembler;

namespace {

LogEntry Entry(LogKind kind, std::uint64_t sequence, Json argument) {
    LogEntry entry;
    entry.kind = kind;
    entry.sequence_number = sequence;
    entry.timestamp_ms = 1735689600000 + static_cast<std::int64_t>(sequence);
    entry.arguments.push_back(std::move(argument));
    return entry;
}

} // namespace

TEST(ResultAssemblerTest, SuccessAppendsResultEntryLast) {
    RawOutcome outcome;
    outcome.status = OutcomeStatus::COMPLETED;
    outcome.value = Json(2);

    auto result = ResultAssembler::Assemble(
        outcome, {Entry(LogKind::LOG, 0, "a"), Entry(LogKind::INFO, 1, "b")},
        std::chrono::milliseconds(12));

    EXPECT_TRUE(result.success);
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(result.value, 2);
    EXPECT_EQ(result.execution_time_ms, 12);

    ASSERT_EQ(result.log.size(), 3u);
    EXPECT_EQ(result.log.back().kind, LogKind::RESULT);
    EXPECT_EQ(result.log.back().arguments, (std::vector<Json>{Json(2)}));
    EXPECT_EQ(result.log.back().sequence_number, 2u);
}

TEST(ResultAssemblerTest, NoReturnedValueMeansNoResultEntry) {
    RawOutcome outcome;
    outcome.status = OutcomeStatus::COMPLETED;

    auto result = ResultAssembler::Assemble(outcome, {Entry(LogKind::LOG, 0, "only")},
                                            std::chrono::milliseconds(1));
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.value.is_null());
    ASSERT_EQ(result.log.size(), 1u);
    EXPECT_EQ(result.log[0].kind, LogKind::LOG);
}

TEST(ResultAssemblerTest, ReturnedNullStillProducesResultEntry) {
    RawOutcome outcome;
    outcome.status = OutcomeStatus::COMPLETED;
    outcome.value = Json(nullptr);

    auto result = ResultAssembler::Assemble(outcome, {}, std::chrono::milliseconds(0));
    ASSERT_EQ(result.log.size(), 1u);
    EXPECT_EQ(result.log[0].kind, LogKind::RESULT);
    EXPECT_EQ(result.log[0].sequence_number, 0u);
}

TEST(ResultAssemblerTest, OrdersLogBySequence) {
    RawOutcome outcome;
    outcome.status = OutcomeStatus::COMPLETED;

    auto result = ResultAssembler::Assemble(
        outcome,
        {Entry(LogKind::WARN, 2, "c"), Entry(LogKind::LOG, 0, "a"), Entry(LogKind::INFO, 1, "b")},
        std::chrono::milliseconds(0));

    ASSERT_EQ(result.log.size(), 3u);
    EXPECT_EQ(result.log[0].arguments[0], "a");
    EXPECT_EQ(result.log[1].arguments[0], "b");
    EXPECT_EQ(result.log[2].arguments[0], "c");
}

TEST(ResultAssemblerTest, FaultKeepsPartialLogWithoutResultEntry) {
    HostReport report;
    report.outcome.status = OutcomeStatus::FAULTED;
    report.outcome.error = ErrorDetail{ErrorCategory::RUNTIME_FAULT, "boom"};
    report.log = {Entry(LogKind::LOG, 0, "before")};
    report.elapsed = std::chrono::milliseconds(4);

    auto result = ResultAssembler::Assemble(report);
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.value.is_null());
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->message, "boom");
    ASSERT_EQ(result.log.size(), 1u);
    EXPECT_EQ(result.log[0].kind, LogKind::LOG);
}

TEST(ResultAssemblerTest, TimeoutWithoutDetailGetsDefaultMessage) {
    RawOutcome outcome;
    outcome.status = OutcomeStatus::TIMED_OUT;

    auto result = ResultAssembler::Assemble(outcome, {}, std::chrono::milliseconds(5000));
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->category, ErrorCategory::TIMEOUT);
}

TEST(ResultAssemblerTest, RejectHasEmptyLogAndZeroTime) {
    auto result = ResultAssembler::Reject(
        ErrorDetail{ErrorCategory::ADMISSION_REJECTED, "Code must not be empty"});
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.log.empty());
    EXPECT_EQ(result.execution_time_ms, 0);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->category, ErrorCategory::ADMISSION_REJECTED);
}

TEST(ResultAssemblerTest, WireFormatOnSuccess) {
    RawOutcome outcome;
    outcome.status = OutcomeStatus::COMPLETED;
    outcome.value = Json{{"ok", true}};
    auto result = ResultAssembler::Assemble(outcome, {Entry(LogKind::LOG, 0, "hi")},
                                            std::chrono::milliseconds(3));

    auto body = ResultAssembler::ToWireJson(result, 1735689600123);
    EXPECT_EQ(body["success"], true);
    EXPECT_EQ(body["result"], Json::parse(R"({"ok":true})"));
    EXPECT_TRUE(body["error"].is_null());
    EXPECT_TRUE(body["errorCategory"].is_null());
    EXPECT_EQ(body["executionTime"], 3);
    EXPECT_EQ(body["timestamp"], 1735689600123);

    ASSERT_EQ(body["console"].size(), 2u);
    EXPECT_EQ(body["console"][0], Json::parse(R"({"type":"log","args":["hi"],"timestamp":1735689600000})"));
    EXPECT_EQ(body["console"][1]["type"], "result");
    EXPECT_EQ(body["console"][1]["args"], Json::parse(R"([{"ok":true}])"));
}

TEST(ResultAssemblerTest, WireFormatOnFailure) {
    auto result = ResultAssembler::Reject(
        ErrorDetail{ErrorCategory::CAPABILITY_VIOLATION, "'fetch' is not defined"});
    auto body = ResultAssembler::ToWireJson(result, 1);

    EXPECT_EQ(body["success"], false);
    EXPECT_TRUE(body["result"].is_null());
    EXPECT_EQ(body["error"], "'fetch' is not defined");
    EXPECT_EQ(body["errorCategory"], "CapabilityViolation");
    EXPECT_EQ(body["console"], Json::array());
    EXPECT_EQ(body["executionTime"], 0);
}
