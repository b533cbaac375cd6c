#include "mender/executor.h"
#include "mender/sandbox.h"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

#ifndef _WIN32
  #include <csignal>
  #include <cstdlib>
  #include <unistd.h>
#endif

namespace mender {

namespace {

std::string rtrim(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ' || s.back() == '\t')) s.pop_back();
    return s;
}

bool is_ident_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
}

void replace_all(std::string& s, const std::string& from, const std::string& to) {
    if (from.empty()) return;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

// RAII private directory for one run.
class ScratchDir {
public:
    explicit ScratchDir(const std::filesystem::path& root) {
#ifndef _WIN32
        std::error_code ec;
        std::filesystem::path base = root;
        if (base.empty()) base = std::filesystem::temp_directory_path(ec);
        if (ec) {
            error_ = "temp_directory_path failed: " + ec.message();
            return;
        }
        std::filesystem::create_directories(base, ec);
        std::string tmpl = (base / "mender_sbx_XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (!mkdtemp(buf.data())) {
            error_ = std::string("mkdtemp failed: ") + std::strerror(errno);
            return;
        }
        path_ = buf.data();
#else
        (void)root;
        error_ = "sandbox scratch directories are not supported on Windows";
#endif
    }
    ~ScratchDir() {
        if (!path_.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }
    }
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    bool ok() const { return !path_.empty(); }
    const std::filesystem::path& path() const { return path_; }
    const std::string& error() const { return error_; }

private:
    std::filesystem::path path_;
    std::string error_;
};

} // namespace

int cpu_share_to_nice(double cpu_share) {
    if (!(cpu_share > 0.0)) return 19;
    if (cpu_share >= 1.0) return 0;
    int n = (int)std::lround((1.0 - cpu_share) * 19.0);
    return std::clamp(n, 0, 19);
}

std::string last_exception_name(const std::string& stderr_text) {
    bool traceback_like = stderr_text.find("Traceback (most recent call last)") != std::string::npos ||
                          stderr_text.find("File \"") != std::string::npos;
    if (!traceback_like) return "";

    std::istringstream iss(stderr_text);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(iss, line)) lines.push_back(rtrim(line));

    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        const std::string& l = *it;
        if (l.empty()) continue;
        // the exception line starts at column 0; indented lines are source context
        if (l[0] == ' ' || l[0] == '\t') return "";
        size_t colon = l.find(':');
        std::string head = colon == std::string::npos ? l : l.substr(0, colon);
        if (head.empty()) return "";
        for (char c : head) {
            if (!is_ident_char(c) && c != '.') return "";
        }
        size_t dot = head.rfind('.');
        return dot == std::string::npos ? head : head.substr(dot + 1);
    }
    return "";
}

ErrorType classify_exception_name(const std::string& name) {
    if (name == "TabError") return ErrorType::IndentationError;
    auto t = parse_error_type(name);
    return t ? *t : ErrorType::UnknownError;
}

ExecutionResult make_timeout_result(double duration_sec, const std::string& detail) {
    ExecutionResult r;
    r.success = false;
    r.timed_out = true;
    r.error_type = ErrorType::TimeoutError;
    r.stack_trace = detail;
    r.duration_sec = duration_sec;
    return r;
}

ExecutionResult make_substrate_failure(const std::string& detail) {
    ExecutionResult r;
    r.success = false;
    r.error_type = ErrorType::UnknownError;
    r.stack_trace = "sandbox failure: " + detail;
    return r;
}

ExecutionResult classify_proc_result(const ProcResult& pr) {
    ExecutionResult r;
    r.stdout_text = pr.output;
    r.duration_sec = pr.elapsed_sec;
    r.exit_code = pr.exit_code;
    r.timed_out = pr.timed_out;
    r.output_truncated = pr.output_truncated;

    if (!pr.timed_out && pr.exit_code == 0 && pr.term_signal == 0) {
        r.success = true;
        return r;
    }

    r.success = false;
    std::string err = rtrim(pr.err_output);

    if (pr.timed_out) {
        r.error_type = ErrorType::TimeoutError;
        std::string msg = "TimeoutError: execution exceeded the wall-clock limit and was terminated";
        r.stack_trace = err.empty() ? msg : err + "\n" + msg;
        return r;
    }

#ifndef _WIN32
    if (pr.term_signal == SIGXCPU) {
        r.error_type = ErrorType::TimeoutError;
        r.stack_trace = err.empty() ? std::string("TimeoutError: CPU time limit exceeded") : err;
        return r;
    }
#endif

    std::string name = last_exception_name(err);
    if (!name.empty()) {
        r.error_type = classify_exception_name(name);
    } else if (err.find("MemoryError") != std::string::npos ||
               err.find("Cannot allocate memory") != std::string::npos) {
        r.error_type = ErrorType::MemoryError;
#ifndef _WIN32
    } else if (pr.term_signal == SIGKILL) {
        // killed without a wall-clock timeout: the kernel OOM killer
        r.error_type = ErrorType::MemoryError;
#endif
    } else {
        r.error_type = ErrorType::UnknownError;
    }

    if (!err.empty()) {
        r.stack_trace = err;
    } else if (pr.term_signal != 0) {
        r.stack_trace = "terminated by signal " + std::to_string(pr.term_signal);
    } else {
        r.stack_trace = "exit code " + std::to_string(pr.exit_code);
    }
    return r;
}

SandboxExecutor::SandboxExecutor(SandboxConfig cfg) : cfg_(std::move(cfg)) {}

ProcLimits SandboxExecutor::make_proc_limits(const ResourceLimits& limits) const {
    ProcLimits lim;
    double timeout = limits.timeout_seconds > 0 ? limits.timeout_seconds : 5.0;
    lim.timeout_ms = (int)std::ceil(timeout * 1000.0);
    lim.stdout_max_bytes = cfg_.stdout_max_bytes;
    // CPU rlimit is only a backstop behind the wall clock
    lim.rlimit_cpu_sec = (int)std::ceil(timeout) + 1;
    lim.rlimit_as_bytes = limits.memory_bytes;
    lim.rlimit_fsize_mb = cfg_.rlimit_fsize_mb;
    lim.rlimit_nofile = cfg_.rlimit_nofile;
    lim.rlimit_nproc = cfg_.rlimit_nproc;
    lim.nice_level = cpu_share_to_nice(limits.cpu_share);
    lim.no_new_privs = true;
    lim.merge_stderr = false;
    lim.deny_network = !limits.network_enabled;
    lim.wrapper = cfg_.wrapper;
    return lim;
}

ExecutionResult SandboxExecutor::execute(const CodeArtifact& code, const ResourceLimits& limits) {
    // never run untrusted code with the network open by accident
    if (!limits.network_enabled && !seccomp_available()) {
        return make_substrate_failure("network isolation unavailable: seccomp filter cannot be installed");
    }
    ScratchDir dir(cfg_.work_root);
    if (!dir.ok()) return make_substrate_failure(dir.error());

    const auto script = dir.path() / cfg_.script_name;
    {
        std::ofstream f(script, std::ios::binary | std::ios::trunc);
        if (!f) return make_substrate_failure("cannot write " + script.string());
        f.write(code.source.data(), (std::streamsize)code.source.size());
        if (!f) return make_substrate_failure("short write to " + script.string());
    }

    ProcLimits lim = make_proc_limits(limits);
    const std::string home = dir.path().string();
    lim.env = std::vector<std::string>{
        "PATH=/usr/local/bin:/usr/bin:/bin",
        "HOME=" + home,
        "TMPDIR=" + home,
        "LANG=C.UTF-8",
        "PYTHONIOENCODING=utf-8",
        "PYTHONHASHSEED=0",
    };

    std::vector<std::string> argv;
    argv.push_back(cfg_.interpreter);
    argv.insert(argv.end(), cfg_.interpreter_args.begin(), cfg_.interpreter_args.end());
    argv.push_back(cfg_.script_name);

    ProcResult pr;
    if (!proc_run_capture_sandboxed(argv, home, lim, &pr)) {
        return make_substrate_failure(pr.error.empty() ? "process did not start" : pr.error);
    }
    if (pr.exit_code == 126 && pr.err_output.find(kFilterInstallFailed) != std::string::npos) {
        return make_substrate_failure("network isolation unavailable: seccomp filter failed to install");
    }
    if (pr.exit_code == 127 && pr.err_output.empty() && !pr.timed_out) {
        ExecutionResult r = make_substrate_failure("interpreter could not be started: " + cfg_.interpreter);
        r.exit_code = pr.exit_code;
        r.duration_sec = pr.elapsed_sec;
        return r;
    }

    ExecutionResult r = classify_proc_result(pr);
    if (r.stack_trace) {
        // stable traces: the scratch path differs on every run
        replace_all(*r.stack_trace, home + "/", "");
    }
    return r;
}

bool SandboxExecutor::probe(std::string* detail) {
    std::string exe = find_executable(cfg_.interpreter);
    if (exe.empty()) {
        if (detail) *detail = "interpreter not found: " + cfg_.interpreter;
        return false;
    }
    ProcLimits lim;
    lim.timeout_ms = 3000;
    lim.stdout_max_bytes = 4096;
    lim.rlimit_as_bytes = 0;
    lim.wrapper = cfg_.wrapper;
    ProcResult pr;
    if (!proc_run_capture_sandboxed({exe, "--version"}, "", lim, &pr)) {
        if (detail) *detail = pr.error;
        return false;
    }
    if (pr.timed_out || pr.exit_code != 0) {
        if (detail) *detail = "interpreter --version failed (exit_code=" + std::to_string(pr.exit_code) + ")";
        return false;
    }
    if (detail) *detail = rtrim(pr.output);
    return true;
}

} // namespace mender
