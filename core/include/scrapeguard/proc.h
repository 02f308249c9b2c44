#pragma once

#include "scrapeguard/sandbox.h"

#include <atomic>
#include <string>
#include <vector>

namespace scrapeguard {

struct ProcLimits {
    int timeout_ms{2000};
    size_t stdout_max_bytes{64 * 1024};

    int rlimit_cpu_sec{2};          // CPU time seconds
    size_t rlimit_as_mb{512};       // virtual memory MB
    size_t rlimit_fsize_mb{10};     // max file size MB
    int rlimit_nofile{64};          // max open fds
    int rlimit_nproc{32};           // max processes (best-effort)

    bool no_new_privs{true};

    // seccomp-BPF syscall allowlist (Linux only, requires no_new_privs).
    bool enable_seccomp{false};
    SeccompProfile seccomp_profile{SeccompProfile::STRICT};

    // false: child stderr goes to /dev/null and only stdout is captured.
    bool merge_stderr{true};

    // SIGKILL the child's process group once the child itself has exited,
    // so helpers it spawned (browser renderers, zygotes) do not outlive it.
    bool kill_group_on_exit{true};

    // Polled while the child runs; when set, the process group is killed
    // and ProcResult.cancelled is reported.
    const std::atomic<bool>* cancel{nullptr};
};

struct ProcResult {
    int exit_code{127};
    bool timed_out{false};
    bool cancelled{false};
    bool output_truncated{false};
    std::string output; // stdout (+stderr when merged)
    std::string error;  // internal runner error, not child stderr
};

// Run a process (argv[0] is executable), capture its output, enforce timeout
// and rlimits (POSIX best-effort). Returns true if the process started.
bool proc_run_capture_sandboxed(const std::vector<std::string>& argv,
                               const std::string& cwd,
                               const ProcLimits& lim,
                               ProcResult* res);

// Same, with stdin_data written to the child's stdin. Writes and reads are
// interleaved so a large payload cannot deadlock against a full stdout pipe.
bool proc_run_capture_sandboxed_stdin(const std::vector<std::string>& argv,
                                     const std::string& cwd,
                                     const std::string& stdin_data,
                                     const ProcLimits& lim,
                                     ProcResult* res);

// Split a command string into argv tokens. Single and double quotes;
// backslash escapes inside double quotes. Empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

} // namespace scrapeguard
