/**
 * @file worker_hardening.cpp
 * @brief Implementation of worker process hardening
 *
 * **Seccomp program layout**:
 * ```
 * [0]       load arch
 * [1]       arch == native ? skip 1 : fall through
 * [2]       KILL_PROCESS
 * [3]       load syscall nr
 * [4..4+n)  nr == allowed[k] ? jump to ALLOW
 * [4+n]     ERRNO(EPERM)
 * [4+n+1]   ALLOW
 * ```
 *
 * @date 2025
 */

#include "evalbox/core/worker_hardening.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <unistd.h>
#include <sys/resource.h>

#if defined(__linux__)
#include <cstddef>
#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <sys/prctl.h>
#include <sys/syscall.h>

#if defined(__x86_64__)
#define EVALBOX_AUDIT_ARCH AUDIT_ARCH_X86_64
#elif defined(__aarch64__)
#define EVALBOX_AUDIT_ARCH AUDIT_ARCH_AARCH64
#else
#define EVALBOX_AUDIT_ARCH 0
#endif

#ifndef SECCOMP_RET_KILL_PROCESS
#define SECCOMP_RET_KILL_PROCESS SECCOMP_RET_KILL
#endif
#endif

namespace evalbox {
namespace core {

namespace {

std::string Errno(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

std::string SetLimit(int resource, rlim_t soft, rlim_t hard, const char* name) {
    struct rlimit limit {};
    limit.rlim_cur = soft;
    limit.rlim_max = hard;
    if (setrlimit(resource, &limit) != 0) {
        return Errno(name);
    }
    return "";
}

#if defined(__linux__) && EVALBOX_AUDIT_ARCH != 0

std::vector<unsigned int> AllowedSyscalls() {
    std::vector<unsigned int> allowed = {
        // Memory
        __NR_brk, __NR_mmap, __NR_munmap, __NR_mremap, __NR_madvise, __NR_mprotect,
        // Result pipe
        __NR_write, __NR_writev, __NR_close,
        // Clock
        __NR_clock_gettime, __NR_gettimeofday,
        // Threads and signals used by libc
        __NR_futex, __NR_rt_sigreturn, __NR_rt_sigprocmask, __NR_rt_sigaction,
        __NR_sigaltstack, __NR_getpid, __NR_getppid, __NR_gettid, __NR_tgkill, __NR_sched_yield,
        // Exit
        __NR_exit, __NR_exit_group,
    };

#ifdef __NR_getrandom
    allowed.push_back(__NR_getrandom);
#endif
#ifdef __NR_clock_getres
    allowed.push_back(__NR_clock_getres);
#endif
#ifdef __NR_fstat
    allowed.push_back(__NR_fstat);
#endif
#ifdef __NR_newfstatat
    allowed.push_back(__NR_newfstatat);
#endif
#ifdef __NR_time
    allowed.push_back(__NR_time);
#endif
#ifdef __NR_getrusage
    allowed.push_back(__NR_getrusage);
#endif

    return allowed;
}

#endif

} // namespace

// ============================================================================
// PROCESS FLAGS
// ============================================================================

std::string WorkerHardening::ApplyProcessFlags() {
#if defined(__linux__)
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        return Errno("PR_SET_NO_NEW_PRIVS");
    }
    if (prctl(PR_SET_PDEATHSIG, SIGKILL, 0, 0, 0) != 0) {
        return Errno("PR_SET_PDEATHSIG");
    }
    if (prctl(PR_SET_DUMPABLE, 0, 0, 0, 0) != 0) {
        return Errno("PR_SET_DUMPABLE");
    }
#endif
    signal(SIGPIPE, SIG_IGN);
    return "";
}

// ============================================================================
// DESCRIPTORS
// ============================================================================

std::string WorkerHardening::CloseInheritedDescriptors(int& keep_fd) {
    constexpr int kTarget = 3;

    if (keep_fd != kTarget) {
        if (dup2(keep_fd, kTarget) < 0) {
            return Errno("dup2");
        }
        close(keep_fd);
        keep_fd = kTarget;
    }
    // dup2 clears FD_CLOEXEC; keep it off for the pipe only
    fcntl(keep_fd, F_SETFD, 0);

    int stdin_fd = open("/dev/null", O_RDONLY);
    if (stdin_fd >= 0 && stdin_fd != STDIN_FILENO) {
        dup2(stdin_fd, STDIN_FILENO);
        close(stdin_fd);
    }

#if defined(__linux__) && defined(SYS_close_range)
    if (syscall(SYS_close_range, kTarget + 1, ~0U, 0) == 0) {
        return "";
    }
#endif

    struct rlimit limit {};
    rlim_t max_fd = 4096;
    if (getrlimit(RLIMIT_NOFILE, &limit) == 0 && limit.rlim_cur != RLIM_INFINITY) {
        max_fd = std::min<rlim_t>(limit.rlim_cur, 65536);
    }
    for (int fd = kTarget + 1; fd < static_cast<int>(max_fd); ++fd) {
        close(fd);
    }
    return "";
}

// ============================================================================
// RESOURCE LIMITS
// ============================================================================

std::string WorkerHardening::ApplyResourceLimits(const WorkerLimits& limits) {
    rlim_t cpu_seconds = static_cast<rlim_t>((limits.cpu_time.count() + 999) / 1000) + 1;

    std::string error = SetLimit(RLIMIT_CPU, cpu_seconds, cpu_seconds + 1, "RLIMIT_CPU");
    if (error.empty()) error = SetLimit(RLIMIT_FSIZE, 0, 0, "RLIMIT_FSIZE");
    if (error.empty()) error = SetLimit(RLIMIT_CORE, 0, 0, "RLIMIT_CORE");
    if (error.empty()) {
        rlim_t files = static_cast<rlim_t>(std::max<std::size_t>(limits.max_open_files, 4));
        error = SetLimit(RLIMIT_NOFILE, files, files, "RLIMIT_NOFILE");
    }
#ifdef RLIMIT_NPROC
    if (error.empty()) error = SetLimit(RLIMIT_NPROC, 0, 0, "RLIMIT_NPROC");
#endif
    return error;
}

// ============================================================================
// SECCOMP
// ============================================================================

#if defined(__linux__) && EVALBOX_AUDIT_ARCH != 0

std::string WorkerHardening::InstallSeccompFilter() {
    const auto allowed = AllowedSyscalls();
    const std::size_t n = allowed.size();

    std::vector<struct sock_filter> program;
    program.reserve(n + 6);

    program.push_back(BPF_STMT(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch)));
    program.push_back(BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, EVALBOX_AUDIT_ARCH, 1, 0));
    program.push_back(BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    program.push_back(BPF_STMT(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr)));

    for (std::size_t k = 0; k < n; ++k) {
        auto jump = static_cast<unsigned char>(n - k);
        program.push_back(BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, allowed[k], jump, 0));
    }

    program.push_back(BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_ERRNO | (EPERM & SECCOMP_RET_DATA)));
    program.push_back(BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));

    struct sock_fprog prog {};
    prog.len = static_cast<unsigned short>(program.size());
    prog.filter = program.data();

    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog, 0, 0) != 0) {
        return Errno("seccomp install failed");
    }
    return "";
}

bool WorkerHardening::SeccompAvailable() {
    return prctl(PR_GET_SECCOMP, 0, 0, 0, 0) >= 0;
}

#else

std::string WorkerHardening::InstallSeccompFilter() {
    return "seccomp: unsupported platform";
}

bool WorkerHardening::SeccompAvailable() {
    return false;
}

#endif

// ============================================================================
// ALL
// ============================================================================

std::string WorkerHardening::Apply(const WorkerLimits& limits, int& keep_fd) {
    std::string error = ApplyProcessFlags();
    if (error.empty()) error = CloseInheritedDescriptors(keep_fd);
    if (error.empty()) error = ApplyResourceLimits(limits);
    if (error.empty() && limits.enable_seccomp && SeccompAvailable()) {
        error = InstallSeccompFilter();
    }
    return error;
}

} // namespace core
} // namespace evalbox
