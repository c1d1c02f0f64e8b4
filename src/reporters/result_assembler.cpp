/**
 * @file result_assembler.cpp
 * @brief Implementation of result assembly and wire rendering
 *
 * @date 2025
 */

#include "evalbox/reporters/result_assembler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace evalbox {
namespace reporters {

using core::ErrorCategory;
using core::ErrorDetail;
using core::EvaluationResult;
using core::Json;
using core::LogEntry;
using core::LogKind;
using core::OutcomeStatus;

EvaluationResult ResultAssembler::Assemble(const core::HostReport& report) {
    return Assemble(report.outcome, report.log, report.elapsed);
}

EvaluationResult ResultAssembler::Assemble(const core::RawOutcome& outcome,
                                           std::vector<LogEntry> log,
                                           std::chrono::milliseconds elapsed) {
    EvaluationResult result;
    result.execution_time_ms = elapsed.count();

    std::stable_sort(log.begin(), log.end(), [](const LogEntry& a, const LogEntry& b) {
        return a.sequence_number < b.sequence_number;
    });
    result.log = std::move(log);

    if (outcome.status == OutcomeStatus::COMPLETED) {
        result.success = true;
        result.value = outcome.value.value_or(Json(nullptr));

        if (outcome.value) {
            LogEntry entry;
            entry.kind = LogKind::RESULT;
            entry.arguments.push_back(*outcome.value);
            entry.sequence_number = result.log.empty() ? 0 : result.log.back().sequence_number + 1;
            entry.timestamp_ms = core::NowMillis();
            result.log.push_back(std::move(entry));
        }
        return result;
    }

    result.success = false;
    result.value = nullptr;
    if (outcome.error) {
        result.error = outcome.error;
    } else if (outcome.status == OutcomeStatus::TIMED_OUT) {
        result.error = ErrorDetail{ErrorCategory::TIMEOUT, "Execution timed out"};
    } else {
        spdlog::warn("Faulted outcome without error detail");
        result.error = ErrorDetail{ErrorCategory::RUNTIME_FAULT, "Evaluation failed"};
    }
    return result;
}

EvaluationResult ResultAssembler::Reject(const ErrorDetail& error) {
    EvaluationResult result;
    result.success = false;
    result.value = nullptr;
    result.error = error;
    result.execution_time_ms = 0;
    return result;
}

// ============================================================================
// WIRE FORMAT
// ============================================================================

Json ResultAssembler::LogEntryToWireJson(const LogEntry& entry) {
    return Json{
        {"type", core::LogKindToString(entry.kind)},
        {"args", entry.arguments},
        {"timestamp", entry.timestamp_ms}
    };
}

Json ResultAssembler::ToWireJson(const EvaluationResult& result, std::int64_t timestamp_ms) {
    Json console = Json::array();
    for (const auto& entry : result.log) {
        console.push_back(LogEntryToWireJson(entry));
    }

    Json body;
    body["success"] = result.success;
    body["result"] = result.success ? result.value : Json(nullptr);
    body["console"] = std::move(console);
    body["error"] = result.error ? Json(result.error->message) : Json(nullptr);
    body["errorCategory"] = result.error
        ? Json(core::ErrorCategoryToString(result.error->category))
        : Json(nullptr);
    body["executionTime"] = result.execution_time_ms;
    body["timestamp"] = timestamp_ms;
    return body;
}

} // namespace reporters
} // namespace evalbox
