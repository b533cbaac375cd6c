#pragma once

#include <string>
#include <vector>
#include <optional>

namespace mender {

inline constexpr char kFilterInstallFailed[] = "sandbox: network deny filter failed to install\n";

struct ProcLimits {
    int timeout_ms{5000};
    size_t stdout_max_bytes{64 * 1024};

    int rlimit_cpu_sec{0};          // CPU time backstop, 0 = unset
    size_t rlimit_as_bytes{0};      // virtual memory, 0 = unset
    size_t rlimit_fsize_mb{10};     // max file size MB
    int rlimit_nofile{64};          // max open fds
    int rlimit_nproc{32};           // max processes (best-effort)
    int nice_level{0};              // 0..19, applied with setpriority()

    bool no_new_privs{true};
    bool merge_stderr{true};        // false: stderr captured into ProcResult::err_output

    // Deny AF_INET/AF_INET6/AF_PACKET sockets in the child (seccomp-BPF, Linux only).
    // If the filter cannot be installed the child writes kFilterInstallFailed
    // to stderr and exits 126 without running the program.
    bool deny_network{false};

    // Replace the inherited environment with these KEY=VALUE entries when set.
    std::optional<std::vector<std::string>> env;

    // Operator-provided isolation wrapper (nsjail/firejail/bwrap argv prefix).
    std::vector<std::string> wrapper;
};

struct ProcResult {
    int exit_code{127};
    int term_signal{0};      // non-zero when the child was killed by a signal
    bool timed_out{false};
    bool output_truncated{false};
    std::string output;      // stdout (+stderr when merged)
    std::string err_output;  // stderr when merge_stderr == false
    std::string error;       // internal runner error, not child stderr
    double elapsed_sec{0.0};
};

// Run a process (argv[0] is executable), capture its output, enforce the
// wall-clock timeout (kills the whole process group) and rlimits.
// Returns true if the process started.
bool proc_run_capture_sandboxed(const std::vector<std::string>& argv,
                               const std::string& cwd,
                               const ProcLimits& lim,
                               ProcResult* res);

// Same as above, feeding stdin_data to the child without deadlocking on
// large payloads.
bool proc_run_capture_sandboxed_stdin(const std::vector<std::string>& argv,
                                     const std::string& cwd,
                                     const std::string& stdin_data,
                                     const ProcLimits& lim,
                                     ProcResult* res);

// Small helper: split a command string into argv tokens.
// Supports basic quotes (single/double) and backslash escaping inside double quotes.
// Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

// Resolve an executable name against PATH (or return it when it already
// contains a slash and is executable). Empty when not found.
std::string find_executable(const std::string& name);

} // namespace mender
