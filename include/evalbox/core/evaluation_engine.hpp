/**
 * @file evaluation_engine.hpp
 * @brief Orchestration of the snippet evaluation pipeline
 *
 * The EvaluationEngine is the single entry point of evalbox. It runs every
 * request through admission, capability context construction, isolated
 * execution and result assembly, and exposes a transport-agnostic request
 * handler that speaks the JSON wire format.
 *
 * @date 2025
 */

#pragma once

#include "evalbox/core/types.hpp"
#include "evalbox/core/engine_config.hpp"

#include <cstddef>
#include <future>
#include <memory>
#include <string>

#ifndef EVALBOX_VERSION
#define EVALBOX_VERSION "1.0.0"
#endif

namespace evalbox {
namespace core {

/**
 * @struct ServiceResponse
 * @brief Status code and JSON body for a transport layer to send
 */
struct ServiceResponse {
    int http_status{200};  ///< 200 for evaluations, 400 for malformed requests
    Json body;             ///< Wire-format body
};

/**
 * @class EvaluationEngine
 * @brief Stateless evaluation service
 *
 * **Pipeline**:
 * ```
 * EvaluationRequest
 *   ├─ 1. AdmissionFilter          size, shape, lexical checks, blocklist
 *   ├─ 2. CapabilityContextBuilder response/request snapshots, allow-list
 *   ├─ 3. ExecutionHost            isolation unit under deadline
 *   └─ 4. ResultAssembler          ordered log, value or error
 * EvaluationResult
 * ```
 * Each stage either passes its product on or short-circuits with a
 * categorized error. Evaluate() never throws.
 *
 * **State Machine** (per call, logged at debug level):
 * `Idle -> Admitted -> ContextBuilt -> Running -> Completed | Faulted | TimedOut`
 *
 * **Thread Safety**: Evaluate(), EvaluateAsync() and HandleRequest() may be
 * called concurrently. The only shared mutable state is the in-flight
 * counter; calls beyond max_concurrent_evaluations fail fast with a
 * RuntimeFault.
 *
 * **Usage Example**:
 * @code
 * EvaluationEngine engine;
 *
 * EvaluationRequest request;
 * request.code = "console.log(response.status); return response.data.items.length;";
 * request.context.response = Json::parse(R"({"status":200,"data":{"items":[1,2,3]}})");
 *
 * auto result = engine.Evaluate(request);
 * if (result.success) {
 *     spdlog::info("Value: {}", result.value.dump());
 * }
 *
 * // Or from a raw request body
 * auto response = engine.HandleRequest(R"({"code": "return 1 + 1;"})");
 * @endcode
 */
class EvaluationEngine {
public:
    using Config = EngineConfig;

    /**
     * @brief Construct engine with custom configuration
     * @param config Engine configuration
     */
    explicit EvaluationEngine(const Config& config);

    /**
     * @brief Construct engine with default configuration
     */
    EvaluationEngine();

    ~EvaluationEngine();

    EvaluationEngine(const EvaluationEngine&) = delete;
    EvaluationEngine& operator=(const EvaluationEngine&) = delete;

    /**
     * @brief Evaluate one snippet
     *
     * @param request Code and context
     * @return Structured result; failures are reported in `error`
     */
    EvaluationResult Evaluate(const EvaluationRequest& request);

    /**
     * @brief Evaluate on a background thread
     * @param request Code and context (copied)
     * @return Future resolving to the result
     */
    std::future<EvaluationResult> EvaluateAsync(EvaluationRequest request);

    /**
     * @brief Handle a raw request body
     *
     * Accepts `{ "code": string, "context"?: { "response"?: any, "request"?: any } }`.
     * Malformed requests (invalid JSON, bad code, bad context) yield status
     * 400; every evaluation that reached the admission filter's identifier
     * scan or beyond yields 200, whether it succeeded or not.
     *
     * @param body Request body text
     */
    ServiceResponse HandleRequest(const std::string& body);

    /**
     * @brief Handle an already-parsed request body
     */
    ServiceResponse HandleRequest(const Json& body);

    /**
     * @brief Service descriptor: name, version, features, usage, limitations
     *
     * Limitations are stated from the engine's own configuration.
     */
    Json DescribeService() const;

    /**
     * @brief Number of evaluations currently in flight
     */
    std::size_t ActiveEvaluations() const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;

    class Impl;
    std::unique_ptr<Impl> impl_;  ///< Pipeline stages and in-flight counter

    EvaluationResult RunPipeline(const EvaluationRequest& request, const std::string& evaluation_id);
    ServiceResponse BadRequest(const std::string& message) const;
    std::string GenerateEvaluationID() const;
};

} // namespace core
} // namespace evalbox
