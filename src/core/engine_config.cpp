/**
 * @file engine_config.cpp
 * @brief JSON (de)serialization of EngineConfig
 *
 * @date 2025
 */

#include "evalbox/core/engine_config.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <set>
#include <stdexcept>

namespace evalbox {
namespace core {

namespace {

constexpr std::size_t kMiB = 1024 * 1024;

std::size_t ReadSize(const Json& value, const std::string& key) {
    if (!value.is_number_unsigned()) {
        throw std::invalid_argument("Configuration key '" + key +
                                    "' must be a non-negative integer");
    }
    return value.get<std::size_t>();
}

std::size_t ReadPositive(const Json& value, const std::string& key) {
    std::size_t size = ReadSize(value, key);
    if (size == 0) {
        throw std::invalid_argument("Configuration key '" + key + "' must be positive");
    }
    return size;
}

bool ReadBool(const Json& value, const std::string& key) {
    if (!value.is_boolean()) {
        throw std::invalid_argument("Configuration key '" + key + "' must be a boolean");
    }
    return value.get<bool>();
}

std::set<std::string> ReadNames(const Json& value, const std::string& key) {
    if (!value.is_array()) {
        throw std::invalid_argument("Configuration key '" + key + "' must be an array of strings");
    }
    std::set<std::string> names;
    for (const auto& item : value) {
        if (!item.is_string()) {
            throw std::invalid_argument("Configuration key '" + key +
                                        "' must be an array of strings");
        }
        names.insert(item.get<std::string>());
    }
    return names;
}

const Json& RequireObject(const Json& value, const std::string& key) {
    if (!value.is_object()) {
        throw std::invalid_argument("Configuration key '" + key + "' must be an object");
    }
    return value;
}

void WarnUnknown(const std::string& key) {
    spdlog::warn("Ignoring unknown configuration key '{}'", key);
}

void ParseAdmission(const Json& section, analyzers::AdmissionFilter::Config& config) {
    for (const auto& [key, value] : section.items()) {
        const std::string path = "admission." + key;
        if (key == "max_code_length") {
            config.max_code_length = ReadPositive(value, path);
        } else if (key == "enable_identifier_scan") {
            config.enable_identifier_scan = ReadBool(value, path);
        } else if (key == "blocked_identifiers") {
            config.blocked_identifiers = ReadNames(value, path);
        } else {
            WarnUnknown(path);
        }
    }
}

void ParseContext(const Json& section, CapabilityContextBuilder::Config& config) {
    for (const auto& [key, value] : section.items()) {
        const std::string path = "context." + key;
        if (key == "max_context_bytes") {
            config.max_context_bytes = ReadPositive(value, path);
        } else if (key == "allowed_globals") {
            config.allowed_globals = ReadNames(value, path);
        } else {
            WarnUnknown(path);
        }
    }
}

void ParseExecution(const Json& section, ExecutionHost::Config& config) {
    for (const auto& [key, value] : section.items()) {
        const std::string path = "execution." + key;
        if (key == "timeout_ms") {
            config.timeout = std::chrono::milliseconds(ReadPositive(value, path));
        } else if (key == "isolation") {
            if (!value.is_string()) {
                throw std::invalid_argument("Configuration key '" + path + "' must be a string");
            }
            auto mode = IsolationModeFromString(value.get<std::string>());
            if (!mode) {
                throw std::invalid_argument("Configuration key '" + path +
                                            "' must be \"process\" or \"thread\"");
            }
            config.isolation = *mode;
        } else if (key == "memory_limit_mb") {
            config.runtime_limits.memory_limit_bytes = ReadPositive(value, path) * kMiB;
        } else if (key == "max_stack_kb") {
            config.runtime_limits.max_stack_bytes = ReadPositive(value, path) * 1024;
        } else if (key == "kill_grace_ms") {
            config.kill_grace = std::chrono::milliseconds(ReadSize(value, path));
        } else if (key == "max_result_bytes") {
            config.runtime_limits.max_result_bytes = ReadPositive(value, path);
        } else if (key == "max_open_files") {
            config.max_open_files = ReadPositive(value, path);
        } else if (key == "enable_seccomp") {
            config.enable_seccomp = ReadBool(value, path);
        } else if (key == "max_log_entries") {
            config.capture_limits.max_entries = ReadSize(value, path);
        } else if (key == "max_log_bytes") {
            config.capture_limits.max_bytes = ReadSize(value, path);
        } else {
            WarnUnknown(path);
        }
    }
}

} // namespace

// ============================================================================
// TO JSON
// ============================================================================

Json EngineConfigToJson(const EngineConfig& config) {
    const auto& blocked = config.admission.blocked_identifiers.empty()
        ? analyzers::AdmissionFilter::DefaultBlockedIdentifiers()
        : config.admission.blocked_identifiers;
    const auto& allowed = config.context.allowed_globals.empty()
        ? CapabilityContextBuilder::DefaultAllowedGlobals()
        : config.context.allowed_globals;
    const auto& execution = config.execution;

    Json json;
    json["admission"] = {
        {"max_code_length", config.admission.max_code_length},
        {"enable_identifier_scan", config.admission.enable_identifier_scan},
        {"blocked_identifiers", blocked}
    };
    json["context"] = {
        {"max_context_bytes", config.context.max_context_bytes},
        {"allowed_globals", allowed}
    };
    json["execution"] = {
        {"timeout_ms", execution.timeout.count()},
        {"isolation", IsolationModeToString(execution.isolation)},
        {"memory_limit_mb", execution.runtime_limits.memory_limit_bytes / kMiB},
        {"max_stack_kb", execution.runtime_limits.max_stack_bytes / 1024},
        {"kill_grace_ms", execution.kill_grace.count()},
        {"max_result_bytes", execution.runtime_limits.max_result_bytes},
        {"max_open_files", execution.max_open_files},
        {"enable_seccomp", execution.enable_seccomp},
        {"max_log_entries", execution.capture_limits.max_entries},
        {"max_log_bytes", execution.capture_limits.max_bytes}
    };
    json["max_concurrent_evaluations"] = config.max_concurrent_evaluations;
    json["verbose_logging"] = config.verbose_logging;
    return json;
}

// ============================================================================
// FROM JSON
// ============================================================================

EngineConfig EngineConfigFromJson(const Json& json) {
    EngineConfig config;
    RequireObject(json, "<root>");

    for (const auto& [key, value] : json.items()) {
        if (key == "admission") {
            ParseAdmission(RequireObject(value, key), config.admission);
        } else if (key == "context") {
            ParseContext(RequireObject(value, key), config.context);
        } else if (key == "execution") {
            ParseExecution(RequireObject(value, key), config.execution);
        } else if (key == "max_concurrent_evaluations") {
            config.max_concurrent_evaluations = ReadPositive(value, key);
        } else if (key == "verbose_logging") {
            config.verbose_logging = ReadBool(value, key);
        } else {
            WarnUnknown(key);
        }
    }

    return config;
}

// ============================================================================
// FILE I/O
// ============================================================================

EngineConfig LoadEngineConfig(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open configuration file: " + path.string());
    }

    Json json;
    try {
        file >> json;
    } catch (const Json::parse_error& e) {
        throw std::runtime_error("Invalid configuration file " + path.string() + ": " + e.what());
    }

    auto config = EngineConfigFromJson(json);
    spdlog::info("Loaded configuration from {}", path.string());
    return config;
}

void SaveEngineConfig(const EngineConfig& config, const std::filesystem::path& path) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write configuration file: " + path.string());
    }

    file << EngineConfigToJson(config).dump(2) << '\n';
    if (!file) {
        throw std::runtime_error("Failed to write configuration file: " + path.string());
    }
    spdlog::info("Configuration saved to {}", path.string());
}

} // namespace core
} // namespace evalbox
