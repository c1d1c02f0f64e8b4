/**
 * @file execution_host.cpp
 * @brief Implementation of the isolation unit supervisor
 *
 * **Process mode**:
 * ```
 * host                                  worker (fork)
 *  │ pipe2(O_CLOEXEC)                     │
 *  │ fork ───────────────────────────────►│ harden (prctl, fds, rlimits, seccomp)
 *  │ poll(read end) until                 │ ScriptRuntime::Run
 *  │   deadline + kill_grace              │   console.* ─► {"type":"log",...}\n
 *  │◄─────────────── JSON lines ──────────│   outcome   ─► {"type":"outcome",...}\n
 *  │ SIGKILL if still running             │ _exit
 *  │ waitpid                              ▼
 * ```
 * The worker never calls spdlog. The host logs captured entries at debug
 * level as they arrive.
 *
 * @date 2025
 */

#include "evalbox/core/execution_host.hpp"
#include "evalbox/core/worker_hardening.hpp"
#include "evalbox/core/worker_protocol.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <future>
#include <stdexcept>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>

namespace evalbox {
namespace core {

namespace {

using Clock = std::chrono::steady_clock;

constexpr int kWorkerExitOk = 0;
constexpr int kWorkerExitSetupFailed = 70;
constexpr int kWorkerExitRuntimeFailed = 71;

// Protocol fields around one log entry's arguments or the outcome value
constexpr std::size_t kLineOverheadBytes = 256;

// A control character escaped in a JSON string takes six bytes
constexpr std::size_t kEscapeExpansion = 6;

void LogCapturedEntry(const LogEntry& entry) {
    if (!spdlog::should_log(spdlog::level::debug)) {
        return;
    }
    Json args(entry.arguments);
    spdlog::debug("  console.{} #{}: {}", LogKindToString(entry.kind), entry.sequence_number,
                  args.dump(-1, ' ', false, Json::error_handler_t::replace));
}

RawOutcome Fault(const std::string& message) {
    RawOutcome outcome;
    outcome.status = OutcomeStatus::FAULTED;
    outcome.error = ErrorDetail{ErrorCategory::RUNTIME_FAULT, message};
    return outcome;
}

int MillisUntil(Clock::time_point when) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(when - Clock::now());
    if (remaining.count() <= 0) {
        return 0;
    }
    return static_cast<int>(remaining.count()) + 1;
}

// Child side
[[noreturn]] void RunWorker(const std::string& code,
                            const CapabilityContext& context,
                            const ExecutionHost::Config& config,
                            Clock::time_point deadline,
                            int write_fd,
                            pid_t parent) {
    WorkerLimits limits;
    limits.cpu_time = config.timeout;
    limits.max_open_files = config.max_open_files;
    limits.enable_seccomp = config.enable_seccomp;

    int fd = write_fd;
    std::string error = WorkerHardening::Apply(limits, fd);

    if (getppid() != parent) {
        _exit(kWorkerExitSetupFailed);
    }
    if (!error.empty()) {
        WorkerProtocol::WriteLine(fd, WorkerProtocol::EncodeOutcome(Fault("Sandbox setup failed")));
        _exit(kWorkerExitSetupFailed);
    }

    try {
        ChannelLogSink sink(fd);
        monitors::OutputCapture capture(config.capture_limits, sink);
        ScriptRuntime runtime(config.runtime_limits, capture);

        RawOutcome outcome = runtime.Run(code, context, deadline);
        bool written = WorkerProtocol::WriteLine(fd, WorkerProtocol::EncodeOutcome(outcome));
        _exit(written ? kWorkerExitOk : kWorkerExitRuntimeFailed);
    }
    catch (const std::exception&) {
        WorkerProtocol::WriteLine(fd, WorkerProtocol::EncodeOutcome(Fault("Evaluation failed")));
        _exit(kWorkerExitRuntimeFailed);
    }
}

// Wait for the worker, killing it if it lingers past the hard deadline
int ReapWorker(pid_t pid, Clock::time_point hard_deadline, bool& killed) {
    int status = 0;
    while (true) {
        pid_t result = waitpid(pid, &status, killed ? 0 : WNOHANG);
        if (result == pid) {
            return status;
        }
        if (result < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("waitpid failed for worker {}: {}", pid, strerror(errno));
            return status;
        }
        if (Clock::now() >= hard_deadline) {
            kill(pid, SIGKILL);
            killed = true;
            continue;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

} // namespace

// ============================================================================
// ISOLATION MODE
// ============================================================================

std::string IsolationModeToString(IsolationMode mode) {
    switch (mode) {
        case IsolationMode::PROCESS: return "process";
        case IsolationMode::THREAD:  return "thread";
    }
    return "process";
}

std::optional<IsolationMode> IsolationModeFromString(const std::string& name) {
    if (name == "process") return IsolationMode::PROCESS;
    if (name == "thread")  return IsolationMode::THREAD;
    return std::nullopt;
}

// ============================================================================
// CONSTRUCTOR
// ============================================================================

ExecutionHost::ExecutionHost()
    : ExecutionHost(Config{}) {
}

ExecutionHost::ExecutionHost(const Config& config)
    : config_(config) {
    spdlog::debug("Execution host: {} isolation, timeout {}ms, memory limit {} bytes",
                  IsolationModeToString(config_.isolation), config_.timeout.count(),
                  config_.runtime_limits.memory_limit_bytes);
}

std::string ExecutionHost::TimeoutMessage() const {
    return "Execution timed out after " + std::to_string(config_.timeout.count()) + " ms";
}

std::size_t ExecutionHost::WorkerOutputLimit() const {
    const auto& capture = config_.capture_limits;
    return config_.runtime_limits.max_result_bytes +
           capture.max_bytes +
           (capture.max_entries + 1) * kLineOverheadBytes +
           kEscapeExpansion * ScriptRuntime::kMaxErrorMessageBytes;
}

// ============================================================================
// EXECUTE
// ============================================================================

HostReport ExecutionHost::Execute(const std::string& code, const CapabilityContext& context) const {
    HostReport report = config_.isolation == IsolationMode::PROCESS
                            ? ExecuteInProcess(code, context)
                            : ExecuteInThread(code, context);

    if (report.outcome.status == OutcomeStatus::TIMED_OUT) {
        report.outcome.value.reset();
        report.outcome.error = ErrorDetail{ErrorCategory::TIMEOUT, TimeoutMessage()};
    }

    spdlog::debug("Isolation unit finished: {} in {}ms ({} log entries)",
                  OutcomeStatusToString(report.outcome.status), report.elapsed.count(),
                  report.log.size());
    return report;
}

// ============================================================================
// PROCESS MODE
// ============================================================================

HostReport ExecutionHost::ExecuteInProcess(const std::string& code,
                                           const CapabilityContext& context) const {
    HostReport report;
    auto start = Clock::now();
    auto deadline = start + config_.timeout;
    auto hard_deadline = deadline + config_.kill_grace;

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) < 0) {
        throw std::runtime_error(std::string("Failed to create result pipe: ") + strerror(errno));
    }

    pid_t parent = getpid();
    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        close(fds[0]);
        close(fds[1]);
        throw std::runtime_error(std::string("Failed to fork worker: ") + strerror(saved));
    }

    if (pid == 0) {
        close(fds[0]);
        RunWorker(code, context, config_, deadline, fds[1], parent);
    }

    close(fds[1]);
    int read_fd = fds[0];
    fcntl(read_fd, F_SETFL, fcntl(read_fd, F_GETFL) | O_NONBLOCK);

    spdlog::debug("Worker {} started", pid);

    const std::size_t output_limit = WorkerOutputLimit();
    std::string buffer;
    std::size_t received = 0;
    bool eof = false;
    bool overflow = false;
    bool protocol_error = false;
    std::optional<RawOutcome> outcome;

    auto consume_lines = [&]() {
        std::size_t newline;
        while ((newline = buffer.find('\n')) != std::string::npos) {
            std::string line = buffer.substr(0, newline);
            buffer.erase(0, newline + 1);
            if (line.empty()) {
                continue;
            }
            try {
                auto message = WorkerProtocol::Decode(line);
                if (message.type == WorkerMessage::Type::LOG) {
                    LogCapturedEntry(message.entry);
                    report.log.push_back(std::move(message.entry));
                } else {
                    outcome = std::move(message.outcome);
                }
            }
            catch (const std::runtime_error& e) {
                spdlog::error("Worker {} protocol error: {}", pid, e.what());
                protocol_error = true;
                return;
            }
        }
    };

    while (!eof && !overflow && !protocol_error) {
        int wait_ms = MillisUntil(hard_deadline);
        if (wait_ms == 0) {
            spdlog::warn("Worker {} exceeded deadline, sending SIGKILL", pid);
            kill(pid, SIGKILL);
            report.killed = true;
            break;
        }

        struct pollfd pfd {};
        pfd.fd = read_fd;
        pfd.events = POLLIN;

        int ready = poll(&pfd, 1, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("poll failed on worker {} pipe: {}", pid, strerror(errno));
            protocol_error = true;
            break;
        }
        if (ready == 0) {
            continue;
        }

        char chunk[8192];
        while (true) {
            ssize_t n = read(read_fd, chunk, sizeof(chunk));
            if (n > 0) {
                received += static_cast<std::size_t>(n);
                if (received > output_limit) {
                    spdlog::warn("Worker {} exceeded output limit of {} bytes", pid, output_limit);
                    overflow = true;
                    break;
                }
                buffer.append(chunk, static_cast<std::size_t>(n));
                continue;
            }
            if (n == 0) {
                eof = true;
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                spdlog::error("read failed on worker {} pipe: {}", pid, strerror(errno));
                protocol_error = true;
            }
            break;
        }

        consume_lines();
    }

    close(read_fd);

    if ((overflow || protocol_error) && !report.killed) {
        kill(pid, SIGKILL);
        report.killed = true;
    }

    int status = ReapWorker(pid, hard_deadline, report.killed);
    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);

    if (outcome && !overflow && !protocol_error) {
        report.outcome = std::move(*outcome);
    } else if (overflow) {
        report.outcome = Fault("Evaluation output limit exceeded");
    } else if (protocol_error) {
        report.outcome = Fault("Evaluation worker terminated unexpectedly");
    } else if (report.killed || (WIFSIGNALED(status) && WTERMSIG(status) == SIGXCPU)) {
        report.outcome.status = OutcomeStatus::TIMED_OUT;
    } else {
        if (WIFSIGNALED(status)) {
            spdlog::error("Worker {} terminated by signal {}", pid, WTERMSIG(status));
        } else if (WIFEXITED(status)) {
            spdlog::error("Worker {} exited with status {} without an outcome",
                          pid, WEXITSTATUS(status));
        }
        report.outcome = Fault("Evaluation worker terminated unexpectedly");
    }

    return report;
}

// ============================================================================
// THREAD MODE
// ============================================================================

HostReport ExecutionHost::ExecuteInThread(const std::string& code,
                                          const CapabilityContext& context) const {
    HostReport report;
    auto start = Clock::now();
    auto deadline = start + config_.timeout;

    std::atomic<bool> cancel{false};

    auto worker = std::async(std::launch::async, [&]() {
        monitors::BufferedLogSink sink;
        monitors::OutputCapture capture(config_.capture_limits, sink);
        ScriptRuntime runtime(config_.runtime_limits, capture);

        RawOutcome outcome;
        try {
            outcome = runtime.Run(code, context, deadline, &cancel);
        }
        catch (const std::exception& e) {
            spdlog::error("Script runtime failure: {}", e.what());
            outcome = Fault("Evaluation failed");
        }

        if (capture.DroppedCount() > 0) {
            spdlog::warn("Dropped {} console entries over capture limits", capture.DroppedCount());
        }
        return std::make_pair(std::move(outcome), sink.TakeEntries());
    });

    if (worker.wait_until(deadline + config_.kill_grace) == std::future_status::timeout) {
        spdlog::warn("Worker thread exceeded deadline, cancelling");
        cancel.store(true);
    }

    auto result = worker.get();
    report.outcome = std::move(result.first);
    report.log = std::move(result.second);
    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);

    for (const auto& entry : report.log) {
        LogCapturedEntry(entry);
    }

    return report;
}

} // namespace core
} // namespace evalbox
