/**
 * @file test_engine_config.cpp
 * @brief Unit tests for engine configuration loading
 *
 * @date 2025
 */

#include "evalbox/core/engine_config.hpp"

#include <gtest/gtest.h>

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using evalbox::core::EngineConfig;
using evalbox::core::EngineConfigFromJson;
using evalbox::core::EngineConfigToJson;
using evalbox::core::IsolationMode;
using evalbox::core::Json;
using evalbox::core::LoadEngineConfig;
using evalbox::core::SaveEngineConfig;

class EngineConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() /
                ("evalbox_config_" + std::to_string(getpid()) + ".json");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    void WriteFile(const std::string& text) {
        std::ofstream file(path_);
        file << text;
    }

    std::filesystem::path path_;
};

TEST_F(EngineConfigTest, DefaultsMatchServiceLimits) {
    EngineConfig config;
    EXPECT_EQ(config.admission.max_code_length, 10000u);
    EXPECT_EQ(config.execution.timeout, std::chrono::milliseconds(5000));
    EXPECT_EQ(config.execution.isolation, IsolationMode::PROCESS);
    EXPECT_TRUE(config.execution.enable_seccomp);
}

TEST_F(EngineConfigTest, EmptyDocumentKeepsDefaults) {
    auto config = EngineConfigFromJson(Json::object());
    EXPECT_EQ(config.admission.max_code_length, 10000u);
    EXPECT_EQ(config.max_concurrent_evaluations, 16u);
}

TEST_F(EngineConfigTest, ParsesAllSections) {
    auto config = EngineConfigFromJson(Json::parse(R"({
        "admission": {"max_code_length": 500, "enable_identifier_scan": false,
                      "blocked_identifiers": ["secret"]},
        "context": {"max_context_bytes": 4096, "allowed_globals": ["JSON"]},
        "execution": {"timeout_ms": 750, "isolation": "thread", "memory_limit_mb": 32,
                      "max_stack_kb": 512, "kill_grace_ms": 0, "max_result_bytes": 65536,
                      "max_open_files": 8, "enable_seccomp": false,
                      "max_log_entries": 10, "max_log_bytes": 2048},
        "max_concurrent_evaluations": 2,
        "verbose_logging": true
    })"));

    EXPECT_EQ(config.admission.max_code_length, 500u);
    EXPECT_FALSE(config.admission.enable_identifier_scan);
    EXPECT_EQ(config.admission.blocked_identifiers, (std::set<std::string>{"secret"}));
    EXPECT_EQ(config.context.max_context_bytes, 4096u);
    EXPECT_EQ(config.context.allowed_globals, (std::set<std::string>{"JSON"}));
    EXPECT_EQ(config.execution.timeout, std::chrono::milliseconds(750));
    EXPECT_EQ(config.execution.isolation, IsolationMode::THREAD);
    EXPECT_EQ(config.execution.runtime_limits.memory_limit_bytes, 32u * 1024 * 1024);
    EXPECT_EQ(config.execution.runtime_limits.max_stack_bytes, 512u * 1024);
    EXPECT_EQ(config.execution.kill_grace, std::chrono::milliseconds(0));
    EXPECT_EQ(config.execution.runtime_limits.max_result_bytes, 65536u);
    EXPECT_EQ(config.execution.max_open_files, 8u);
    EXPECT_FALSE(config.execution.enable_seccomp);
    EXPECT_EQ(config.execution.capture_limits.max_entries, 10u);
    EXPECT_EQ(config.execution.capture_limits.max_bytes, 2048u);
    EXPECT_EQ(config.max_concurrent_evaluations, 2u);
    EXPECT_TRUE(config.verbose_logging);
}

TEST_F(EngineConfigTest, RejectsInvalidValues) {
    EXPECT_THROW(EngineConfigFromJson(Json::array()), std::invalid_argument);
    EXPECT_THROW(EngineConfigFromJson(Json::parse(R"({"admission": 5})")), std::invalid_argument);
    EXPECT_THROW(EngineConfigFromJson(Json::parse(R"({"execution": {"timeout_ms": 0}})")),
                 std::invalid_argument);
    EXPECT_THROW(EngineConfigFromJson(Json::parse(R"({"execution": {"timeout_ms": -5}})")),
                 std::invalid_argument);
    EXPECT_THROW(EngineConfigFromJson(Json::parse(R"({"execution": {"isolation": "vm"}})")),
                 std::invalid_argument);
    EXPECT_THROW(EngineConfigFromJson(Json::parse(R"({"admission": {"blocked_identifiers": [1]}})")),
                 std::invalid_argument);
    EXPECT_THROW(EngineConfigFromJson(Json::parse(R"({"verbose_logging": "yes"})")),
                 std::invalid_argument);
}

TEST_F(EngineConfigTest, IgnoresUnknownKeys) {
    auto config = EngineConfigFromJson(Json::parse(R"({"colour": "blue", "execution": {"gpu": true}})"));
    EXPECT_EQ(config.execution.timeout, std::chrono::milliseconds(5000));
}

TEST_F(EngineConfigTest, ToJsonWritesDefaultListsExplicitly) {
    auto json = EngineConfigToJson(EngineConfig{});
    EXPECT_FALSE(json["admission"]["blocked_identifiers"].empty());
    EXPECT_FALSE(json["context"]["allowed_globals"].empty());
    EXPECT_EQ(json["execution"]["isolation"], "process");
    EXPECT_EQ(json["execution"]["memory_limit_mb"], 64);
}

TEST_F(EngineConfigTest, SaveThenLoad) {
    EngineConfig config;
    config.execution.timeout = std::chrono::milliseconds(1234);
    config.execution.isolation = IsolationMode::THREAD;
    config.admission.blocked_identifiers = {"alpha", "beta"};

    SaveEngineConfig(config, path_);
    auto loaded = LoadEngineConfig(path_);

    EXPECT_EQ(loaded.execution.timeout, std::chrono::milliseconds(1234));
    EXPECT_EQ(loaded.execution.isolation, IsolationMode::THREAD);
    EXPECT_EQ(loaded.admission.blocked_identifiers, (std::set<std::string>{"alpha", "beta"}));
}

TEST_F(EngineConfigTest, LoadReportsMissingAndMalformedFiles) {
    EXPECT_THROW(LoadEngineConfig(path_.string() + ".missing"), std::runtime_error);

    WriteFile("{ not json");
    EXPECT_THROW(LoadEngineConfig(path_), std::runtime_error);
}
