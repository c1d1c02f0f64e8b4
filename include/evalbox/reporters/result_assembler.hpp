/**
 * @file result_assembler.hpp
 * @brief Builds the final EvaluationResult and its wire representation
 *
 * The assembler is the last stage of the pipeline. It turns the raw outcome
 * and partial log produced by the execution host into a caller-facing
 * EvaluationResult, and renders results as the JSON body returned to clients.
 *
 * **Wire Format**:
 * ```json
 * {
 *   "success": true,
 *   "result": 2,
 *   "console": [
 *     {"type": "log", "args": ["a"], "timestamp": 1735689600000},
 *     {"type": "result", "args": [2], "timestamp": 1735689600001}
 *   ],
 *   "error": null,
 *   "errorCategory": null,
 *   "executionTime": 3,
 *   "timestamp": 1735689600002
 * }
 * ```
 *
 * @date 2025
 */

#pragma once

#include "evalbox/core/types.hpp"
#include "evalbox/core/execution_host.hpp"

#include <chrono>
#include <cstdint>
#include <vector>

namespace evalbox {
namespace reporters {

/**
 * @class ResultAssembler
 * @brief Stateless result construction
 *
 * **Invariants of every assembled result**:
 * - `success` is true exactly when `error` is empty
 * - `log` is ordered by strictly increasing sequence number
 * - A `result` entry appears only on success with a returned value, and last
 *
 * All methods are static.
 */
class ResultAssembler {
public:
    /**
     * @brief Assemble from the execution host's report
     */
    static core::EvaluationResult Assemble(const core::HostReport& report);

    /**
     * @brief Assemble from individual parts
     * @param outcome Raw outcome
     * @param log Entries captured before completion or abort
     * @param elapsed Time spent running
     */
    static core::EvaluationResult Assemble(const core::RawOutcome& outcome,
                                           std::vector<core::LogEntry> log,
                                           std::chrono::milliseconds elapsed);

    /**
     * @brief Result for a request stopped before execution
     *
     * Empty log and zero execution time.
     */
    static core::EvaluationResult Reject(const core::ErrorDetail& error);

    /**
     * @brief Render a result as the client-facing JSON body
     * @param result Assembled result
     * @param timestamp_ms Response timestamp
     */
    static core::Json ToWireJson(const core::EvaluationResult& result, std::int64_t timestamp_ms);

    /**
     * @brief Render one log entry as `{type, args, timestamp}`
     */
    static core::Json LogEntryToWireJson(const core::LogEntry& entry);
};

} // namespace reporters
} // namespace evalbox
