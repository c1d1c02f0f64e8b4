/**
 * @file types.hpp
 * @brief Data model shared by every stage of the evaluation pipeline
 *
 * Defines the request, log, outcome and result structures exchanged between
 * the admission filter, the capability context builder, the execution host and
 * the result assembler. All of them are plain values created for a single
 * evaluation and discarded at its end.
 *
 * @date 2025
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace evalbox {
namespace core {

using Json = nlohmann::json;

/**
 * @enum LogKind
 * @brief Kind of a captured console entry
 */
enum class LogKind {
    LOG,     ///< console.log / console.debug
    INFO,    ///< console.info
    WARN,    ///< console.warn
    ERROR,   ///< console.error and unhandled promise rejections
    RESULT   ///< Returned value, appended by the assembler
};

/**
 * @enum ErrorCategory
 * @brief Failure taxonomy of an evaluation
 *
 * Every failed evaluation carries exactly one category. None of them ever
 * propagates past the engine boundary.
 */
enum class ErrorCategory {
    ADMISSION_REJECTED,    ///< Bad shape or size, rejected before execution
    CAPABILITY_VIOLATION,  ///< Name outside the capability allow-list
    RUNTIME_FAULT,         ///< Exception raised while evaluating
    TIMEOUT                ///< Deadline exceeded
};

/**
 * @enum EvaluationState
 * @brief Lifecycle of one evaluation call
 *
 * `IDLE -> ADMITTED -> CONTEXT_BUILT -> RUNNING -> {COMPLETED | FAULTED | TIMED_OUT}`.
 * A rejection before RUNNING moves straight to FAULTED.
 */
enum class EvaluationState {
    IDLE,
    ADMITTED,
    CONTEXT_BUILT,
    RUNNING,
    COMPLETED,
    FAULTED,
    TIMED_OUT
};

/**
 * @enum OutcomeStatus
 * @brief Terminal status reported by the execution host
 */
enum class OutcomeStatus {
    COMPLETED,
    FAULTED,
    TIMED_OUT
};

/**
 * @struct ErrorDetail
 * @brief Categorized, human-readable failure description
 *
 * `message` never contains stack traces or host paths.
 */
struct ErrorDetail {
    ErrorCategory category{ErrorCategory::RUNTIME_FAULT};  ///< Failure category
    std::string message;                                   ///< Human-readable message
};

/**
 * @struct LogEntry
 * @brief One captured console call
 *
 * `sequence_number` is strictly increasing in emission order and is the only
 * ordering guarantee. `timestamp_ms` is informational.
 */
struct LogEntry {
    LogKind kind{LogKind::LOG};       ///< Console method used
    std::vector<Json> arguments;      ///< Call arguments, converted to JSON
    std::uint64_t sequence_number{0}; ///< Emission order
    std::int64_t timestamp_ms{0};     ///< Wall clock, ms since epoch
};

/**
 * @struct EvaluationContext
 * @brief Read-only data supplied with a request
 *
 * Null members are replaced by empty objects when the capability context is
 * built.
 */
struct EvaluationContext {
    Json response;  ///< Prior network response
    Json request;   ///< Prior network request
};

/**
 * @struct EvaluationRequest
 * @brief One evaluation call
 */
struct EvaluationRequest {
    std::string code;           ///< Snippet source (function body)
    EvaluationContext context;  ///< Data the snippet may read
};

/**
 * @struct RawOutcome
 * @brief What the isolation unit reports before assembly
 */
struct RawOutcome {
    OutcomeStatus status{OutcomeStatus::FAULTED};  ///< Terminal status
    std::optional<Json> value;                     ///< Returned value (nullopt when absent)
    std::optional<ErrorDetail> error;              ///< Set unless COMPLETED
};

/**
 * @struct EvaluationResult
 * @brief Structured report returned to the caller
 *
 * Exactly one of (`success` with `value`, possibly null) or (`!success` with
 * `error`) holds. `log` is always present.
 */
struct EvaluationResult {
    bool success{false};               ///< Evaluation completed
    Json value;                        ///< Returned value or null
    std::vector<LogEntry> log;         ///< Ordered console output
    std::optional<ErrorDetail> error;  ///< Failure detail
    std::int64_t execution_time_ms{0}; ///< Time spent in RUNNING
};

// Enum helpers
std::string LogKindToString(LogKind kind);
std::optional<LogKind> LogKindFromString(const std::string& name);
std::string ErrorCategoryToString(ErrorCategory category);
std::optional<ErrorCategory> ErrorCategoryFromString(const std::string& name);
std::string EvaluationStateToString(EvaluationState state);
std::string OutcomeStatusToString(OutcomeStatus status);
std::optional<OutcomeStatus> OutcomeStatusFromString(const std::string& name);

/**
 * @brief Current wall-clock time in milliseconds since the epoch
 */
std::int64_t NowMillis();

} // namespace core
} // namespace evalbox
