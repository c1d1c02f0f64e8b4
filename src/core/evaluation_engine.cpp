/**
 * @file evaluation_engine.cpp
 * @brief Implementation of the evaluation pipeline and request handler
 *
 * @date 2025
 */

#include "evalbox/core/evaluation_engine.hpp"
#include "evalbox/analyzers/admission_filter.hpp"
#include "evalbox/core/capability_context.hpp"
#include "evalbox/core/execution_host.hpp"
#include "evalbox/reporters/result_assembler.hpp"
#include "evalbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <random>
#include <sstream>
#include <stdexcept>

namespace evalbox {
namespace core {

using reporters::ResultAssembler;

// ============================================================================
// PIMPL IMPLEMENTATION
// ============================================================================

class EvaluationEngine::Impl {
public:
    explicit Impl(const EngineConfig& config)
        : admission(config.admission)
        , context_builder(config.context)
        , host(config.execution) {
    }

    analyzers::AdmissionFilter admission;
    CapabilityContextBuilder context_builder;
    ExecutionHost host;

    std::atomic<std::size_t> active{0};
};

namespace {

/// Holds one in-flight slot for the lifetime of an evaluation.
class ActiveSlot {
public:
    ActiveSlot(std::atomic<std::size_t>& counter, std::size_t limit)
        : counter_(counter) {
        acquired_ = counter_.fetch_add(1) < limit;
    }

    ~ActiveSlot() { counter_.fetch_sub(1); }

    ActiveSlot(const ActiveSlot&) = delete;
    ActiveSlot& operator=(const ActiveSlot&) = delete;

    bool Acquired() const { return acquired_; }

private:
    std::atomic<std::size_t>& counter_;
    bool acquired_{false};
};

void Transition(const std::string& id, EvaluationState& state, EvaluationState next) {
    spdlog::debug("[{}] {} -> {}", id, EvaluationStateToString(state),
                  EvaluationStateToString(next));
    state = next;
}

EvaluationState TerminalState(const EvaluationResult& result) {
    if (result.success) {
        return EvaluationState::COMPLETED;
    }
    if (result.error && result.error->category == ErrorCategory::TIMEOUT) {
        return EvaluationState::TIMED_OUT;
    }
    return EvaluationState::FAULTED;
}

ServiceResponse ToResponse(const EvaluationResult& result) {
    ServiceResponse response;
    response.http_status =
        (result.error && result.error->category == ErrorCategory::ADMISSION_REJECTED) ? 400 : 200;
    response.body = ResultAssembler::ToWireJson(result, NowMillis());
    return response;
}

std::string FormatTimeout(std::chrono::milliseconds timeout) {
    auto ms = timeout.count();
    if (ms > 0 && ms % 1000 == 0) {
        auto seconds = ms / 1000;
        return std::to_string(seconds) + (seconds == 1 ? " second" : " seconds");
    }
    return std::to_string(ms) + " ms";
}

} // namespace

EvaluationEngine::EvaluationEngine()
    : EvaluationEngine(Config{}) {
}

EvaluationEngine::EvaluationEngine(const Config& config)
    : config_(config)
    , impl_(std::make_unique<Impl>(config)) {

    if (config_.verbose_logging) {
        spdlog::set_level(spdlog::level::debug);
    }

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("evalbox Evaluation Engine v{}", EVALBOX_VERSION);
    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::debug("Isolation: {}, timeout: {} ms, memory limit: {} bytes",
                  IsolationModeToString(config_.execution.isolation),
                  config_.execution.timeout.count(),
                  config_.execution.runtime_limits.memory_limit_bytes);
}

EvaluationEngine::~EvaluationEngine() = default;

// ============================================================================
// EVALUATION
// ============================================================================

EvaluationResult EvaluationEngine::Evaluate(const EvaluationRequest& request) {
    const std::string id = GenerateEvaluationID();

    ActiveSlot slot(impl_->active, config_.max_concurrent_evaluations);
    if (!slot.Acquired()) {
        spdlog::warn("[{}] Rejected: {} evaluations already in flight", id,
                     config_.max_concurrent_evaluations);
        return ResultAssembler::Reject(
            ErrorDetail{ErrorCategory::RUNTIME_FAULT, "Evaluation capacity exceeded"});
    }

    return RunPipeline(request, id);
}

std::future<EvaluationResult> EvaluationEngine::EvaluateAsync(EvaluationRequest request) {
    return std::async(std::launch::async, [this, request = std::move(request)]() {
        return Evaluate(request);
    });
}

EvaluationResult EvaluationEngine::RunPipeline(const EvaluationRequest& request,
                                               const std::string& id) {
    EvaluationState state = EvaluationState::IDLE;

    try {
        // Stage 1: admission
        auto verdict = impl_->admission.Admit(request.code);
        if (!verdict.admitted) {
            Transition(id, state, EvaluationState::FAULTED);
            spdlog::info("[{}] Rejected at admission ({}): {}", id,
                         ErrorCategoryToString(verdict.rejection->category),
                         verdict.rejection->message);
            return ResultAssembler::Reject(*verdict.rejection);
        }
        Transition(id, state, EvaluationState::ADMITTED);
        spdlog::debug("[{}] Admitted {} code points, {} identifiers", id,
                      verdict.code_points, verdict.identifier_count);

        // Stage 2: capability context
        std::optional<CapabilityContext> context;
        try {
            context = impl_->context_builder.Build(request.context);
        } catch (const std::invalid_argument& e) {
            Transition(id, state, EvaluationState::FAULTED);
            spdlog::info("[{}] Context rejected: {}", id, e.what());
            return ResultAssembler::Reject(
                ErrorDetail{ErrorCategory::ADMISSION_REJECTED, e.what()});
        }
        Transition(id, state, EvaluationState::CONTEXT_BUILT);

        // Stage 3: execution
        Transition(id, state, EvaluationState::RUNNING);
        auto report = impl_->host.Execute(request.code, *context);
        if (report.killed) {
            spdlog::warn("[{}] Worker killed after deadline", id);
        }

        // Stage 4: assembly
        auto result = ResultAssembler::Assemble(report);
        Transition(id, state, TerminalState(result));

        if (result.success) {
            spdlog::info("[{}] Completed in {} ms ({} log entries)", id,
                         result.execution_time_ms, result.log.size());
        } else {
            spdlog::info("[{}] {} in {} ms: {}", id,
                         ErrorCategoryToString(result.error->category),
                         result.execution_time_ms, result.error->message);
        }
        return result;

    } catch (const std::exception& e) {
        spdlog::error("[{}] Evaluation failed in state {}: {}", id,
                      EvaluationStateToString(state), e.what());
        return ResultAssembler::Reject(
            ErrorDetail{ErrorCategory::RUNTIME_FAULT, "Internal evaluation error"});
    }
}

// ============================================================================
// REQUEST HANDLING
// ============================================================================

ServiceResponse EvaluationEngine::HandleRequest(const std::string& body) {
    Json parsed;
    try {
        parsed = Json::parse(body);
    } catch (const Json::parse_error& e) {
        spdlog::debug("Unparseable request body: {}", e.what());
        return BadRequest("Invalid JSON body");
    }
    return HandleRequest(parsed);
}

ServiceResponse EvaluationEngine::HandleRequest(const Json& body) {
    if (!body.is_object()) {
        return BadRequest("Request body must be a JSON object");
    }

    const bool has_code = body.contains("code");
    const Json code = has_code ? body.at("code") : Json(nullptr);

    // Shape checks on the raw member; the text checks run again in the pipeline
    if (!has_code || !code.is_string()) {
        auto verdict = impl_->admission.Admit(code, has_code);
        return ToResponse(ResultAssembler::Reject(*verdict.rejection));
    }

    EvaluationRequest request;
    request.code = code.get<std::string>();

    if (body.contains("context") && !body.at("context").is_null()) {
        const Json& context = body.at("context");
        if (!context.is_object()) {
            return BadRequest("Context must be an object");
        }
        request.context.response = context.value("response", Json(nullptr));
        request.context.request = context.value("request", Json(nullptr));
    }

    return ToResponse(Evaluate(request));
}

ServiceResponse EvaluationEngine::BadRequest(const std::string& message) const {
    return ToResponse(ResultAssembler::Reject(
        ErrorDetail{ErrorCategory::ADMISSION_REJECTED, message}));
}

// ============================================================================
// SERVICE DESCRIPTOR
// ============================================================================

Json EvaluationEngine::DescribeService() const {
    Json usage;
    usage["method"] = "POST";
    usage["body"] = {
        {"code", "console.log(\"Hello\"); return response.data?.message;"},
        {"context", {
            {"response", {{"data", {{"message", "Hello World"}}}}},
            {"request", {{"method", "GET"}, {"url", "https://api.example.com/greeting"}}}
        }}
    };

    return Json{
        {"service", "evalbox"},
        {"message", "JavaScript Evaluation Service"},
        {"version", EVALBOX_VERSION},
        {"description", "Evaluates untrusted JavaScript snippets against captured "
                        "network responses and requests in an isolated sandbox"},
        {"features", Json::array({
            "Access to response and request data",
            "Console output capture (log, info, warn, error)",
            "Asynchronous snippets (await, Promise)",
            "Execution timeout with forced termination",
            "Blocked access to host globals, dynamic code and I/O"
        })},
        {"usage", usage},
        {"limitations", Json::array({
            "Maximum code length: " +
                utils::StringUtils::FormatThousands(config_.admission.max_code_length) +
                " characters",
            "Execution timeout: " + FormatTimeout(config_.execution.timeout),
            "No network, filesystem or timer access",
            "No module imports"
        })}
    };
}

std::size_t EvaluationEngine::ActiveEvaluations() const {
    return impl_->active.load();
}

// ============================================================================
// HELPER FUNCTIONS
// ============================================================================

std::string EvaluationEngine::GenerateEvaluationID() const {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time, &local);

    thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<> dis(1000, 9999);

    std::ostringstream oss;
    oss << "eval_" << std::put_time(&local, "%Y%m%d_%H%M%S") << "_" << dis(gen);
    return oss.str();
}

} // namespace core
} // namespace evalbox
