/**
 * @file script_runtime.hpp
 * @brief Embedded QuickJS runtime that executes one snippet
 *
 * Every call to Run() creates a fresh QuickJS runtime and context on the
 * calling thread, installs the capability context, runs the snippet and
 * tears everything down again. Nothing survives between calls.
 *
 * **Global scope of a snippet**:
 * - Audited intrinsics named by the capability context (JSON, Math, ...)
 * - `console` with `log`, `info`, `warn`, `error` and `debug`
 * - `response` and `request`, deep-frozen and read-only
 * - `NaN`, `Infinity`, `undefined`
 *
 * The constructors of ordinary, generator, async and async generator
 * functions are replaced by a thrower, so no function value leads back to
 * code generation from strings.
 *
 * @date 2025
 */

#pragma once

#include "evalbox/core/types.hpp"
#include "evalbox/core/capability_context.hpp"
#include "evalbox/monitors/output_capture.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>

namespace evalbox {
namespace core {

/**
 * @struct RuntimeLimits
 * @brief Per-runtime resource limits
 */
struct RuntimeLimits {
    std::size_t memory_limit_bytes{64 * 1024 * 1024};  ///< QuickJS heap limit
    std::size_t max_stack_bytes{1024 * 1024};          ///< QuickJS stack limit
    std::size_t max_result_bytes{16 * 1024 * 1024};    ///< Serialized size of the returned value
};

/**
 * @class ScriptRuntime
 * @brief Runs a snippet as the body of a strict async arrow function
 *
 * **Execution Model**:
 * ```
 * (function () { "use strict"; return (async () => {
 *     <snippet>
 * }); })
 * ```
 * The outer function is called with `this` undefined, the arrow it returns
 * is called once and the job queue is drained until the returned promise
 * settles. A fulfilled promise gives the value (absent when
 * the snippet falls off the end), a rejected one a fault. A promise that is
 * still pending once no jobs are left is a fault as well.
 *
 * **Error Classification**:
 * - ReferenceError -> CAPABILITY_VIOLATION
 * - Interrupt (deadline or cancellation) -> TIMED_OUT
 * - Anything else -> RUNTIME_FAULT, message only
 *
 * Messages are cut to kMaxErrorMessageBytes. A value whose serialized form
 * exceeds RuntimeLimits::max_result_bytes faults with "Result too large",
 * whichever isolation mode runs the snippet.
 *
 * **Thread Safety**: One instance per evaluation. Run() must execute on the
 * thread that owns the instance.
 *
 * **Usage Example**:
 * @code
 * monitors::BufferedLogSink sink;
 * monitors::OutputCapture capture(monitors::OutputCapture::Limits{}, sink);
 * ScriptRuntime runtime(RuntimeLimits{}, capture);
 *
 * auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
 * auto outcome = runtime.Run("return response.a + 1;", context, deadline);
 * @endcode
 */
class ScriptRuntime {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::size_t kMaxErrorMessageBytes = 4096;

    ScriptRuntime(const RuntimeLimits& limits, monitors::OutputCapture& capture);

    ScriptRuntime(const ScriptRuntime&) = delete;
    ScriptRuntime& operator=(const ScriptRuntime&) = delete;

    /**
     * @brief Execute a snippet
     * @param code Snippet source
     * @param context Capability context
     * @param deadline Execution is interrupted once this point passes
     * @param cancel Optional flag; setting it interrupts execution
     * @return Raw outcome
     * @throws std::runtime_error if the runtime cannot be set up
     */
    RawOutcome Run(const std::string& code,
                   const CapabilityContext& context,
                   Clock::time_point deadline,
                   const std::atomic<bool>* cancel = nullptr);

    /**
     * @brief Whether the last Run() was stopped by the interrupt handler
     */
    bool WasInterrupted() const { return interrupted_; }

    /**
     * @brief Source text actually compiled and run for a snippet
     */
    static std::string WrapSnippet(const std::string& code);

    /**
     * @brief Same wrapper with the snippet nested in a block, compiled only
     *
     * A `}` that closes the arrow body early can only be followed by `,` or
     * `)`, neither of which may follow a block. A snippet that compiles in
     * WrapSnippet() but not here is therefore closing its wrapper, and is
     * rejected before anything runs.
     */
    static std::string WrapSnippetInBlock(const std::string& code);

private:
    RuntimeLimits limits_;
    monitors::OutputCapture& capture_;
    bool interrupted_{false};
};

} // namespace core
} // namespace evalbox
