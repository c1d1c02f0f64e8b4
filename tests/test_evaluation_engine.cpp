/**
 * @file test_evaluation_engine.cpp
 * @brief End-to-end tests of the evaluation pipeline and request handler
 *
 * @date 2025
 */

#include "evalbox/core/evaluation_engine.hpp"
#include "evalbox/utils/string_utils.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

using evalbox::core::EngineConfig;
using evalbox::core::ErrorCategory;
using evalbox::core::EvaluationEngine;
using evalbox::core::EvaluationRequest;
using evalbox::core::EvaluationResult;
using evalbox::core::IsolationMode;
using evalbox::core::Json;
using evalbox::core::LogKind;

class EvaluationEngineTest : public ::testing::Test {
protected:
    static EvaluationRequest Request(const std::string& code, Json response = nullptr,
                                     Json request = nullptr) {
        EvaluationRequest evaluation;
        evaluation.code = code;
        evaluation.context.response = std::move(response);
        evaluation.context.request = std::move(request);
        return evaluation;
    }

    static void ExpectError(const EvaluationResult& result, ErrorCategory category) {
        EXPECT_FALSE(result.success);
        ASSERT_TRUE(result.error.has_value());
        EXPECT_EQ(result.error->category, category);
    }

    EvaluationEngine engine_;
};

// ============================================================================
// PIPELINE PROPERTIES
// ============================================================================

TEST_F(EvaluationEngineTest, OversizedCodeIsRejectedBeforeExecution) {
    auto result = engine_.Evaluate(Request(std::string(10001, ';')));
    ExpectError(result, ErrorCategory::ADMISSION_REJECTED);
    EXPECT_EQ(result.error->message, "Code too long. Maximum 10,000 characters allowed.");
    EXPECT_TRUE(result.log.empty());
    EXPECT_EQ(result.execution_time_ms, 0);
}

TEST_F(EvaluationEngineTest, NormalSnippetReturnsItsValue) {
    auto result = engine_.Evaluate(Request(R"(
        const items = response.data.items;
        return { count: items.length, first: items[0], method: request.method };
    )", Json{{"data", {{"items", {"x", "y"}}}}}, Json{{"method", "GET"}}));

    EXPECT_TRUE(result.success);
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(result.value, Json::parse(R"({"count":2,"first":"x","method":"GET"})"));
}

TEST_F(EvaluationEngineTest, InfiniteLoopTimesOutAndEngineStaysResponsive) {
    EngineConfig config;
    config.execution.timeout = std::chrono::milliseconds(500);
    EvaluationEngine engine(config);

    auto start = std::chrono::steady_clock::now();
    auto result = engine.Evaluate(Request("while (true) {}"));
    auto elapsed = std::chrono::steady_clock::now() - start;

    ExpectError(result, ErrorCategory::TIMEOUT);
    EXPECT_EQ(result.error->message, "Execution timed out after 500 ms");
    EXPECT_LT(elapsed, std::chrono::milliseconds(500 + 250 + 1500));

    auto next = engine.Evaluate(Request("return 'still here';"));
    EXPECT_TRUE(next.success);
    EXPECT_EQ(next.value, "still here");
}

TEST_F(EvaluationEngineTest, LogEntriesFollowProgramOrder) {
    auto result = engine_.Evaluate(Request(R"(
        console.log("a");
        let total = 0;
        for (let i = 0; i < 100000; i++) total += i;
        console.log("b");
        return total;
    )"));

    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.log.size(), 3u);
    EXPECT_EQ(result.log[0].arguments[0], "a");
    EXPECT_EQ(result.log[1].arguments[0], "b");
    EXPECT_EQ(result.log[2].kind, LogKind::RESULT);
    for (std::size_t i = 1; i < result.log.size(); ++i) {
        EXPECT_LT(result.log[i - 1].sequence_number, result.log[i].sequence_number);
    }
}

TEST_F(EvaluationEngineTest, ConcurrentEvaluationsDoNotShareContext) {
    auto mutator = engine_.EvaluateAsync(Request(R"(
        try { response.a = 99; } catch (e) { console.log(e.name); }
        return response.a;
    )", Json{{"a", 1}}));
    auto reader = engine_.EvaluateAsync(Request("return response.a;", Json{{"a", 1}}));

    auto mutated = mutator.get();
    auto read = reader.get();

    ASSERT_TRUE(mutated.success);
    EXPECT_EQ(mutated.value, 1);
    ASSERT_FALSE(mutated.log.empty());
    EXPECT_EQ(mutated.log[0].arguments[0], "TypeError");

    ASSERT_TRUE(read.success);
    EXPECT_EQ(read.value, 1);
}

TEST_F(EvaluationEngineTest, SimpleRoundTrip) {
    auto result = engine_.Evaluate(Request("return response.a + 1;", Json{{"a", 1}}));
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.value, 2);
}

TEST_F(EvaluationEngineTest, TimerCallIsCapabilityViolation) {
    auto result = engine_.Evaluate(Request("setTimeout(() => {}, 10); return 1;"));
    ExpectError(result, ErrorCategory::CAPABILITY_VIOLATION);
    EXPECT_EQ(result.error->message, "'setTimeout' is not defined");
    EXPECT_TRUE(result.log.empty());
}

TEST_F(EvaluationEngineTest, NonStringCodeIsRejected) {
    auto response = engine_.HandleRequest(Json{{"code", 123}});
    EXPECT_EQ(response.http_status, 400);
    EXPECT_EQ(response.body["success"], false);
    EXPECT_EQ(response.body["error"], "Code must be a string");
    EXPECT_EQ(response.body["errorCategory"], "AdmissionRejected");
    EXPECT_EQ(response.body["console"], Json::array());
    EXPECT_EQ(response.body["executionTime"], 0);
}

// ============================================================================
// ERROR TAXONOMY
// ============================================================================

TEST_F(EvaluationEngineTest, UnresolvedNameAtRuntimeIsCapabilityViolation) {
    auto result = engine_.Evaluate(Request("const name = 'x'; return notAThing[name];"));
    ExpectError(result, ErrorCategory::CAPABILITY_VIOLATION);
}

TEST_F(EvaluationEngineTest, ThrowIsRuntimeFaultWithPartialLog) {
    auto result = engine_.Evaluate(Request("console.log('step 1'); throw new Error('failed here');"));
    ExpectError(result, ErrorCategory::RUNTIME_FAULT);
    EXPECT_EQ(result.error->message, "failed here");
    ASSERT_EQ(result.log.size(), 1u);
    EXPECT_EQ(result.log[0].arguments[0], "step 1");
}

TEST_F(EvaluationEngineTest, EscapeAttemptsFail) {
    for (const char* code : {
             "return this.constructor.constructor('return process')();",
             "return [].constructor.constructor('return 1')();",
             "return Object.getPrototypeOf(async () => {}).constructor('return 1')();"}) {
        auto result = engine_.Evaluate(Request(code));
        EXPECT_FALSE(result.success) << code;
        ASSERT_TRUE(result.error.has_value()) << code;
    }
}

TEST_F(EvaluationEngineTest, WrapperEscapeIsRejected) {
    auto result = engine_.Evaluate(Request("return 1; })(); (async function () { return 2;"));
    ExpectError(result, ErrorCategory::ADMISSION_REJECTED);
    EXPECT_EQ(result.execution_time_ms, 0);

    auto hidden = engine_.HandleRequest(Json{
        {"code", "var of = 2; of /1}); console.log('escaped'); (function(){ of /2"}});
    EXPECT_EQ(hidden.http_status, 400);
    EXPECT_EQ(hidden.body["errorCategory"], "AdmissionRejected");
    EXPECT_EQ(hidden.body["console"], Json::array());
}

TEST_F(EvaluationEngineTest, OversizedContextIsRejected) {
    EngineConfig config;
    config.context.max_context_bytes = 128;
    EvaluationEngine engine(config);

    auto result = engine.Evaluate(Request("return 1;", Json{{"blob", std::string(500, 'x')}}));
    ExpectError(result, ErrorCategory::ADMISSION_REJECTED);
    EXPECT_EQ(result.error->message, "Context too large");
}

TEST_F(EvaluationEngineTest, ThreadIsolationGivesSameResults) {
    EngineConfig config;
    config.execution.isolation = IsolationMode::THREAD;
    config.execution.timeout = std::chrono::milliseconds(300);
    EvaluationEngine engine(config);

    auto ok = engine.Evaluate(Request("console.log('t'); return response.a * 3;", Json{{"a", 2}}));
    EXPECT_TRUE(ok.success);
    EXPECT_EQ(ok.value, 6);
    EXPECT_EQ(ok.log.size(), 2u);

    auto timeout = engine.Evaluate(Request("for (;;) {}"));
    ExpectError(timeout, ErrorCategory::TIMEOUT);
}

TEST_F(EvaluationEngineTest, CapacityLimitRejectsExcessCalls) {
    EngineConfig config;
    config.max_concurrent_evaluations = 1;
    config.execution.timeout = std::chrono::milliseconds(1000);
    EvaluationEngine engine(config);

    auto busy = engine.EvaluateAsync(Request("while (true) {}"));
    while (engine.ActiveEvaluations() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    auto rejected = engine.Evaluate(Request("return 1;"));
    ExpectError(rejected, ErrorCategory::RUNTIME_FAULT);
    EXPECT_EQ(rejected.error->message, "Evaluation capacity exceeded");

    ExpectError(busy.get(), ErrorCategory::TIMEOUT);
    EXPECT_EQ(engine.ActiveEvaluations(), 0u);

    EXPECT_TRUE(engine.Evaluate(Request("return 1;")).success);
}

// ============================================================================
// REQUEST HANDLING
// ============================================================================

TEST_F(EvaluationEngineTest, HandleRequestHappyPath) {
    auto response = engine_.HandleRequest(std::string(R"({
        "code": "console.log(\"Hello\"); return response.data?.message;",
        "context": {"response": {"data": {"message": "Hello World"}}}
    })"));

    EXPECT_EQ(response.http_status, 200);
    const auto& body = response.body;
    EXPECT_EQ(body["success"], true);
    EXPECT_EQ(body["result"], "Hello World");
    EXPECT_TRUE(body["error"].is_null());
    ASSERT_EQ(body["console"].size(), 2u);
    EXPECT_EQ(body["console"][0]["type"], "log");
    EXPECT_EQ(body["console"][0]["args"], Json::parse(R"(["Hello"])"));
    EXPECT_EQ(body["console"][1]["type"], "result");
    EXPECT_TRUE(body["executionTime"].is_number_integer());
    EXPECT_TRUE(body["timestamp"].is_number_integer());
}

TEST_F(EvaluationEngineTest, HandleRequestMalformedBodies) {
    struct Case {
        std::string body;
        std::string error;
    };
    const std::vector<Case> cases = {
        {"{not json", "Invalid JSON body"},
        {"[1, 2]", "Request body must be a JSON object"},
        {"{}", "Missing required field: code"},
        {R"({"code": null})", "Code must be a string"},
        {R"({"code": "   "})", "Code must not be empty"},
        {R"({"code": "return 1;", "context": 5})", "Context must be an object"},
        {R"({"code": "return 'abc;"})", "Syntax error: Unterminated string literal (line 1)"},
    };

    for (const auto& c : cases) {
        auto response = engine_.HandleRequest(c.body);
        EXPECT_EQ(response.http_status, 400) << c.body;
        EXPECT_EQ(response.body["success"], false) << c.body;
        EXPECT_EQ(response.body["error"], c.error) << c.body;
        EXPECT_EQ(response.body["errorCategory"], "AdmissionRejected") << c.body;
        EXPECT_TRUE(response.body["console"].empty()) << c.body;
    }
}

TEST_F(EvaluationEngineTest, HandleRequestFailedEvaluationsAre200) {
    auto blocked = engine_.HandleRequest(Json{{"code", "return fetch('https://example.com');"}});
    EXPECT_EQ(blocked.http_status, 200);
    EXPECT_EQ(blocked.body["errorCategory"], "CapabilityViolation");
    EXPECT_EQ(blocked.body["error"], "'fetch' is not defined");

    auto thrown = engine_.HandleRequest(Json{{"code", "throw new Error('nope');"}});
    EXPECT_EQ(thrown.http_status, 200);
    EXPECT_EQ(thrown.body["errorCategory"], "RuntimeFault");
    EXPECT_EQ(thrown.body["error"], "nope");
}

TEST_F(EvaluationEngineTest, HandleRequestNullContextMembersDefaultToObjects) {
    auto response = engine_.HandleRequest(Json{
        {"code", "return [typeof response, typeof request];"},
        {"context", {{"response", nullptr}}}});
    EXPECT_EQ(response.http_status, 200);
    EXPECT_EQ(response.body["result"], Json::parse(R"(["object", "object"])"));
}

TEST_F(EvaluationEngineTest, DescribeService) {
    auto description = engine_.DescribeService();
    EXPECT_EQ(description["service"], "evalbox");
    EXPECT_EQ(description["version"], EVALBOX_VERSION);
    EXPECT_TRUE(description["features"].is_array());
    EXPECT_TRUE(description["limitations"].is_array());
    EXPECT_EQ(description["usage"]["method"], "POST");
    EXPECT_TRUE(description["usage"]["body"]["code"].is_string());

    const auto& limitations = description["limitations"];
    EXPECT_EQ(limitations[0], "Maximum code length: " +
                                  evalbox::utils::StringUtils::FormatThousands(
                                      engine_.GetConfig().admission.max_code_length) +
                                  " characters");
}

TEST_F(EvaluationEngineTest, DescribeServiceStatesConfiguredLimits) {
    EvaluationEngine::Config config;
    config.admission.max_code_length = 2500;
    config.execution.timeout = std::chrono::milliseconds(1500);
    EvaluationEngine engine(config);

    auto limitations = engine.DescribeService()["limitations"];
    ASSERT_GE(limitations.size(), 2u);
    EXPECT_EQ(limitations[0], "Maximum code length: 2,500 characters");
    EXPECT_EQ(limitations[1], "Execution timeout: 1500 ms");

    config.admission.max_code_length = 10000;
    config.execution.timeout = std::chrono::milliseconds(5000);
    EXPECT_EQ(EvaluationEngine(config).DescribeService()["limitations"][1],
              "Execution timeout: 5 seconds");
}
