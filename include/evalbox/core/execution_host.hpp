/**
 * @file execution_host.hpp
 * @brief Runs a snippet inside a killable isolation unit under a deadline
 *
 * The host owns the only part of the pipeline that can block: it starts an
 * isolation unit, collects the log entries it produces and enforces the
 * deadline. Two isolation modes are available:
 *
 * - **PROCESS** (default): a forked, hardened worker per evaluation. Log
 *   entries and the outcome are streamed back over a pipe. On deadline expiry
 *   plus a short grace period the worker receives SIGKILL and is reaped.
 * - **THREAD**: the runtime runs on a worker thread of the host. The QuickJS
 *   interrupt handler checks the deadline and a cancellation flag. Code that
 *   never reaches an interrupt check (a pathological regular expression,
 *   for instance) cannot be stopped in this mode.
 *
 * @date 2025
 */

#pragma once

#include "evalbox/core/types.hpp"
#include "evalbox/core/capability_context.hpp"
#include "evalbox/core/script_runtime.hpp"
#include "evalbox/monitors/output_capture.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace evalbox {
namespace core {

/**
 * @enum IsolationMode
 * @brief Kind of isolation unit
 */
enum class IsolationMode {
    PROCESS,  ///< Forked worker process, killable
    THREAD    ///< Worker thread, interrupt-based cancellation only
};

std::string IsolationModeToString(IsolationMode mode);
std::optional<IsolationMode> IsolationModeFromString(const std::string& name);

/**
 * @struct HostReport
 * @brief Everything the isolation unit produced
 */
struct HostReport {
    RawOutcome outcome;                     ///< Terminal status and value or error
    std::vector<LogEntry> log;              ///< Entries in sequence order (partial on abort)
    std::chrono::milliseconds elapsed{0};   ///< Time from start to teardown
    bool killed{false};                     ///< Worker received SIGKILL
};

/**
 * @class ExecutionHost
 * @brief Isolation unit supervisor
 *
 * **Failure Mapping**:
 * | Observation                                  | Outcome               |
 * |----------------------------------------------|-----------------------|
 * | Outcome line received                        | As reported           |
 * | Killed at deadline, or SIGXCPU               | TIMED_OUT             |
 * | Output over WorkerOutputLimit()              | RUNTIME_FAULT         |
 * | Any other exit without an outcome            | RUNTIME_FAULT         |
 *
 * Timeout messages are rewritten to name the configured limit.
 *
 * **Thread Safety**: Execute() is const and may be called concurrently; each
 * call owns its isolation unit.
 *
 * **Usage Example**:
 * @code
 * ExecutionHost::Config config;
 * config.timeout = std::chrono::milliseconds(2000);
 * config.isolation = IsolationMode::PROCESS;
 *
 * ExecutionHost host(config);
 * auto report = host.Execute("console.log('hi'); return 1;", context);
 * @endcode
 */
class ExecutionHost {
public:
    /**
     * @struct Config
     * @brief Isolation and limit settings
     */
    struct Config {
        std::chrono::milliseconds timeout{5000};           ///< Execution deadline
        IsolationMode isolation{IsolationMode::PROCESS};   ///< Isolation unit kind
        RuntimeLimits runtime_limits;                      ///< QuickJS heap and stack
        std::chrono::milliseconds kill_grace{250};         ///< Wait after deadline before SIGKILL
        std::size_t max_open_files{16};                    ///< Worker RLIMIT_NOFILE
        bool enable_seccomp{true};                         ///< Worker syscall allowlist
        monitors::OutputCapture::Limits capture_limits;    ///< Console capture bounds
    };

    explicit ExecutionHost(const Config& config);
    ExecutionHost();

    /**
     * @brief Run a snippet to completion, fault or timeout
     * @param code Admitted snippet
     * @param context Capability context
     * @return Report; never a partially running unit
     * @throws std::runtime_error if the isolation unit cannot be created
     */
    HostReport Execute(const std::string& code, const CapabilityContext& context) const;

    const Config& GetConfig() const { return config_; }

    /**
     * @brief Message used for every timeout
     */
    std::string TimeoutMessage() const;

    /**
     * @brief Pipe data accepted from one worker
     *
     * Derived from the result, capture and error message limits, so any
     * outcome a thread-mode run could return also fits through the pipe.
     */
    std::size_t WorkerOutputLimit() const;

private:
    HostReport ExecuteInProcess(const std::string& code, const CapabilityContext& context) const;
    HostReport ExecuteInThread(const std::string& code, const CapabilityContext& context) const;

    Config config_;
};

} // namespace core
} // namespace evalbox
