/**
 * @file worker_hardening.hpp
 * @brief Privilege reduction applied inside a forked evaluation worker
 *
 * Called in the child between fork() and running the snippet. None of the
 * functions log; they report failures as a non-empty error string so that the
 * worker can send a fault outcome to the host and exit.
 *
 * **Applied Restrictions**:
 * - `PR_SET_NO_NEW_PRIVS`, `PR_SET_PDEATHSIG(SIGKILL)`, not dumpable
 * - Every inherited descriptor closed except the result pipe
 * - `RLIMIT_CPU` slightly above the deadline, `RLIMIT_FSIZE` 0,
 *   `RLIMIT_CORE` 0, `RLIMIT_NOFILE`, `RLIMIT_NPROC` 0
 * - Optional seccomp-BPF allowlist: memory management, reading the clock,
 *   writing to the pipe and exiting. Everything else fails with EPERM.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace evalbox {
namespace core {

/**
 * @struct WorkerLimits
 * @brief Resource limits for a worker process
 */
struct WorkerLimits {
    std::chrono::milliseconds cpu_time{5000};  ///< Rounded up to whole seconds, plus one
    std::size_t max_open_files{16};            ///< RLIMIT_NOFILE
    bool enable_seccomp{true};                 ///< Install the syscall allowlist
};

/**
 * @class WorkerHardening
 * @brief Static helpers, each returning "" on success or an error description
 */
class WorkerHardening {
public:
    /**
     * @brief Set no-new-privs, parent-death signal and non-dumpable
     */
    static std::string ApplyProcessFlags();

    /**
     * @brief Move @p keep_fd to descriptor 3 and close everything above it
     * @param keep_fd Descriptor to keep (updated to its new number)
     */
    static std::string CloseInheritedDescriptors(int& keep_fd);

    /**
     * @brief Apply rlimits
     */
    static std::string ApplyResourceLimits(const WorkerLimits& limits);

    /**
     * @brief Install the seccomp allowlist
     *
     * Must run after ApplyProcessFlags(). Syscalls not on the list return
     * EPERM.
     */
    static std::string InstallSeccompFilter();

    /**
     * @brief Check whether the kernel supports seccomp filters
     */
    static bool SeccompAvailable();

    /**
     * @brief Apply everything in order
     */
    static std::string Apply(const WorkerLimits& limits, int& keep_fd);
};

} // namespace core
} // namespace evalbox
