#pragma once
#include "types.h"
#include "proc.h"

#include <filesystem>
#include <string>
#include <vector>

namespace mender {

struct SandboxConfig {
    std::string interpreter{"python3"};
    std::vector<std::string> interpreter_args{"-u", "-I", "-B"};
    std::string script_name{"main.py"};
    size_t stdout_max_bytes{256 * 1024};
    std::vector<std::string> wrapper;      // optional nsjail/bwrap prefix
    std::filesystem::path work_root;       // empty: system temp directory
    int rlimit_nproc{32};
    int rlimit_nofile{64};
    size_t rlimit_fsize_mb{10};
};

// Sandbox execution contract. Implementations must be safe to call from a
// worker thread and must not keep state between calls.
class ISandboxExecutor {
public:
    virtual ~ISandboxExecutor() = default;
    virtual ExecutionResult execute(const CodeArtifact& code, const ResourceLimits& limits) = 0;
    // Readiness check; never runs user code.
    virtual bool probe(std::string* detail) = 0;
};

// Process sandbox: one private temp directory and one interpreter process per
// call, torn down before returning.
class SandboxExecutor final : public ISandboxExecutor {
public:
    explicit SandboxExecutor(SandboxConfig cfg);
    ExecutionResult execute(const CodeArtifact& code, const ResourceLimits& limits) override;
    bool probe(std::string* detail) override;

    const SandboxConfig& config() const { return cfg_; }

private:
    ProcLimits make_proc_limits(const ResourceLimits& limits) const;

    SandboxConfig cfg_;
};

// Nice value (0..19) for a fractional CPU share in (0,1].
int cpu_share_to_nice(double cpu_share);

// Name of the exception class reported on the last traceback line of
// interpreter stderr ("ZeroDivisionError: division by zero" -> "ZeroDivisionError").
// Empty when no such line exists.
std::string last_exception_name(const std::string& stderr_text);

// Map a raw exception class name into the closed ErrorType set.
ErrorType classify_exception_name(const std::string& name);

// Build an ExecutionResult from a finished process run. Keeps the
// success/error_type invariant.
ExecutionResult classify_proc_result(const ProcResult& pr);

// Synthesized result for a run that never produced a process outcome.
ExecutionResult make_timeout_result(double duration_sec, const std::string& detail);
ExecutionResult make_substrate_failure(const std::string& detail);

} // namespace mender
