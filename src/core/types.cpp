/**
 * @file types.cpp
 * @brief String conversions for the evaluation data model
 *
 * Names match the wire format: log kinds are lowercase console method names,
 * error categories are PascalCase identifiers.
 *
 * @date 2025
 */

#include "evalbox/core/types.hpp"

#include <chrono>

namespace evalbox {
namespace core {

std::string LogKindToString(LogKind kind) {
    switch (kind) {
        case LogKind::LOG:    return "log";
        case LogKind::INFO:   return "info";
        case LogKind::WARN:   return "warn";
        case LogKind::ERROR:  return "error";
        case LogKind::RESULT: return "result";
    }
    return "log";
}

std::optional<LogKind> LogKindFromString(const std::string& name) {
    if (name == "log")    return LogKind::LOG;
    if (name == "info")   return LogKind::INFO;
    if (name == "warn")   return LogKind::WARN;
    if (name == "error")  return LogKind::ERROR;
    if (name == "result") return LogKind::RESULT;
    return std::nullopt;
}

std::string ErrorCategoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::ADMISSION_REJECTED:   return "AdmissionRejected";
        case ErrorCategory::CAPABILITY_VIOLATION: return "CapabilityViolation";
        case ErrorCategory::RUNTIME_FAULT:        return "RuntimeFault";
        case ErrorCategory::TIMEOUT:              return "Timeout";
    }
    return "RuntimeFault";
}

std::optional<ErrorCategory> ErrorCategoryFromString(const std::string& name) {
    if (name == "AdmissionRejected")   return ErrorCategory::ADMISSION_REJECTED;
    if (name == "CapabilityViolation") return ErrorCategory::CAPABILITY_VIOLATION;
    if (name == "RuntimeFault")        return ErrorCategory::RUNTIME_FAULT;
    if (name == "Timeout")             return ErrorCategory::TIMEOUT;
    return std::nullopt;
}

std::string EvaluationStateToString(EvaluationState state) {
    switch (state) {
        case EvaluationState::IDLE:          return "Idle";
        case EvaluationState::ADMITTED:      return "Admitted";
        case EvaluationState::CONTEXT_BUILT: return "ContextBuilt";
        case EvaluationState::RUNNING:       return "Running";
        case EvaluationState::COMPLETED:     return "Completed";
        case EvaluationState::FAULTED:       return "Faulted";
        case EvaluationState::TIMED_OUT:     return "TimedOut";
    }
    return "Idle";
}

std::string OutcomeStatusToString(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::COMPLETED: return "completed";
        case OutcomeStatus::FAULTED:   return "faulted";
        case OutcomeStatus::TIMED_OUT: return "timed_out";
    }
    return "faulted";
}

std::optional<OutcomeStatus> OutcomeStatusFromString(const std::string& name) {
    if (name == "completed") return OutcomeStatus::COMPLETED;
    if (name == "faulted")   return OutcomeStatus::FAULTED;
    if (name == "timed_out") return OutcomeStatus::TIMED_OUT;
    return std::nullopt;
}

std::int64_t NowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace core
} // namespace evalbox
