/**
 * @file engine_config.hpp
 * @brief Aggregate configuration of the evaluation engine and its JSON form
 *
 * **File Layout** (every key optional):
 * ```json
 * {
 *   "admission": {
 *     "max_code_length": 10000,
 *     "enable_identifier_scan": true,
 *     "blocked_identifiers": ["eval", "Function", "..."]
 *   },
 *   "context": {
 *     "max_context_bytes": 8388608,
 *     "allowed_globals": ["JSON", "Math", "..."]
 *   },
 *   "execution": {
 *     "timeout_ms": 5000,
 *     "isolation": "process",
 *     "memory_limit_mb": 64,
 *     "max_stack_kb": 1024,
 *     "kill_grace_ms": 250,
 *     "max_result_bytes": 16777216,
 *     "max_open_files": 16,
 *     "enable_seccomp": true,
 *     "max_log_entries": 1000,
 *     "max_log_bytes": 1048576
 *   },
 *   "max_concurrent_evaluations": 16,
 *   "verbose_logging": false
 * }
 * ```
 * Unknown keys are reported with a warning and ignored. A key with the wrong
 * type or an out-of-range value is an error.
 *
 * @date 2025
 */

#pragma once

#include "evalbox/core/types.hpp"
#include "evalbox/core/capability_context.hpp"
#include "evalbox/core/execution_host.hpp"
#include "evalbox/analyzers/admission_filter.hpp"

#include <cstddef>
#include <filesystem>

namespace evalbox {
namespace core {

/**
 * @struct EngineConfig
 * @brief Configuration of every pipeline stage plus engine limits
 */
struct EngineConfig {
    analyzers::AdmissionFilter::Config admission;   ///< Stage 1
    CapabilityContextBuilder::Config context;       ///< Stage 2
    ExecutionHost::Config execution;                ///< Stages 3 and 4

    std::size_t max_concurrent_evaluations{16};     ///< In-flight evaluation bound
    bool verbose_logging{false};                    ///< Enable debug logging
};

/**
 * @brief Render the effective configuration
 *
 * Empty blocklist and allow-list are written out as their defaults.
 */
Json EngineConfigToJson(const EngineConfig& config);

/**
 * @brief Parse a configuration document over the defaults
 * @throws std::invalid_argument on wrong types or invalid values
 */
EngineConfig EngineConfigFromJson(const Json& json);

/**
 * @brief Load configuration from a JSON file
 * @throws std::runtime_error if the file cannot be read or parsed
 * @throws std::invalid_argument on wrong types or invalid values
 */
EngineConfig LoadEngineConfig(const std::filesystem::path& path);

/**
 * @brief Write the effective configuration as pretty-printed JSON
 * @throws std::runtime_error if the file cannot be written
 */
void SaveEngineConfig(const EngineConfig& config, const std::filesystem::path& path);

} // namespace core
} // namespace evalbox
