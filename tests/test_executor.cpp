#include "test_common.h"
#include "mender/executor.h"
#include "mender/orchestrator.h"
#include "mender/sandbox.h"

#include <cstdlib>
#include <filesystem>

#include <unistd.h>

using namespace mender;

static ExecutionResult run(SandboxExecutor& sb, const std::string& code, const ResourceLimits& lim) {
    return sb.execute(CodeArtifact{code, 0}, lim);
}

int main() {
    if (!have_python3("test_executor")) return 0;
    namespace fs = std::filesystem;

    const fs::path root = fs::temp_directory_path() / ("mender_test_exec_" + std::to_string(getpid()));
    SandboxConfig cfg;
    cfg.work_root = root;
    auto sb = std::make_shared<SandboxExecutor>(cfg);

    const bool filter = seccomp_available();
    ResourceLimits lim;
    lim.timeout_seconds = 2.0;
    // hosts without seccomp can only run programs with the network allowed
    lim.network_enabled = !filter;

    std::string detail;
    expect_true(sb->probe(&detail), "probe: " + detail);
    expect_true(contains(detail, "Python 3"), "version reported: " + detail);

    // Success
    {
        ExecutionResult r = run(*sb, "print(2+2)\n", lim);
        expect_true(r.success, "print(2+2) succeeds");
        expect_eq_str(r.stdout_text, "4\n", "stdout");
        expect_true(!r.error_type && !r.stack_trace, "no error on success");
    }

    // Runtime errors, with stable traces
    {
        ExecutionResult r = run(*sb, "print(1/0)\n", lim);
        expect_true(!r.success && r.error_type == ErrorType::ZeroDivisionError, "zero division");
        expect_true(contains(*r.stack_trace, "File \"main.py\", line 1"), "scratch path removed: " + *r.stack_trace);

        r = run(*sb, "print(undefined_var)\n", lim);
        expect_true(r.error_type == ErrorType::NameError, "name error");

        r = run(*sb, "import mender_no_such_module_xyz\n", lim);
        expect_true(r.error_type == ErrorType::ModuleNotFoundError, "module not found");

        r = run(*sb, "print('a' + 1)\n", lim);
        expect_true(r.error_type == ErrorType::TypeError, "type error");

        r = run(*sb, "def f():\nreturn 1\n", lim);
        expect_true(r.error_type == ErrorType::IndentationError, "indentation error");

        r = run(*sb, "print(\n", lim);
        expect_true(r.error_type == ErrorType::SyntaxError, "syntax error");

        r = run(*sb, "import sys\nsys.exit(3)\n", lim);
        expect_true(r.error_type == ErrorType::UnknownError, "plain exit code");
        expect_eq_ll(r.exit_code, 3, "exit code kept");

        r = run(*sb, "raise KeyError('k')\n", lim);
        expect_true(r.error_type == ErrorType::UnknownError, "exception outside the closed set");
    }

    // Resource limits
    {
        ResourceLimits t = lim;
        t.timeout_seconds = 1.0;
        ExecutionResult r = run(*sb, "print('looping', flush=True)\nwhile True:\n    pass\n", t);
        expect_true(r.error_type == ErrorType::TimeoutError && r.timed_out, "infinite loop times out");
        expect_eq_str(r.stdout_text, "looping\n", "partial stdout kept");
        expect_true(r.duration_sec < 4.0, "killed near the limit");

        r = run(*sb, "x = bytearray(1024 * 1024 * 1024)\nprint(len(x))\n", lim);
        expect_true(r.error_type == ErrorType::MemoryError, "memory cap enforced");
    }

    // Network denial, the default for untrusted code
    {
        ResourceLimits closed;
        closed.timeout_seconds = 2.0;
        expect_true(!closed.network_enabled, "network off by default");
        ExecutionResult r = run(*sb,
            "import socket\n"
            "try:\n"
            "    socket.socket(socket.AF_INET, socket.SOCK_STREAM)\n"
            "    print('open')\n"
            "except PermissionError:\n"
            "    print('blocked')\n",
            closed);
        if (filter) {
            expect_eq_str(r.stdout_text, "blocked\n", "internet sockets refused");
        } else {
            expect_true(!r.success && contains(*r.stack_trace, "network isolation unavailable"),
                        "refuses to run without the filter");
        }
    }

    // Nothing persists between runs
    {
        ExecutionResult r = run(*sb, "open('state.txt', 'w').write('1')\n", lim);
        expect_true(r.success, "write in scratch dir");
        r = run(*sb, "import os\nprint(os.path.exists('state.txt'))\n", lim);
        expect_eq_str(r.stdout_text, "False\n", "fresh directory each run");
        std::error_code ec;
        expect_true(fs::is_empty(root, ec), "scratch directories removed");

        r = run(*sb,
                "import subprocess\n"
                "p = subprocess.Popen(['sleep', '30'])\n"
                "print(p.pid)\n",
                lim);
        expect_true(r.success, "spawning run succeeds");
        const long child = std::atol(r.stdout_text.c_str());
        expect_true(child > 0, "child pid printed: " + r.stdout_text);
        expect_true(wait_process_gone(child), "spawned process gone after execute");
    }

    // Missing interpreter is a substrate failure, not a crash
    {
        SandboxConfig bad = cfg;
        bad.interpreter = "/nonexistent/python3";
        SandboxExecutor sbad(bad);
        ExecutionResult r = run(sbad, "print(1)\n", lim);
        expect_true(!r.success && r.error_type == ErrorType::UnknownError, "substrate failure");
        expect_true(contains(*r.stack_trace, "sandbox failure"), "explained");
        expect_true(!sbad.probe(nullptr), "probe fails");
    }

    // End to end with the real sandbox and no inference service
    {
        PatchGeneratorConfig gcfg;
        auto gen = std::make_shared<PatchGenerator>(std::make_shared<NullBackend>(), gcfg);
        OrchestratorConfig ocfg;
        ocfg.limits = lim;
        RepairOrchestrator orch(sb, gen, ocfg);

        RepairSession s = orch.repair("print(1/0)\n", 3);
        expect_true(s.terminal_state == TerminalState::SUCCESS, "print(1/0) repaired");
        expect_eq_ll(s.total_iterations, 2, "in two executions");
        expect_eq_str(s.executions[1].stdout_text, "Error: Division by zero\n", "guard message printed");

        s = orch.repair("x = 0\nif 10 / x > 1:\n    print('big')\nprint(\n    10 / x\n)\n", 3);
        expect_true(s.terminal_state == TerminalState::SUCCESS, "header and multi-line call repaired");

        s = orch.repair("print(undefined_var)\n", 3);
        expect_true(s.terminal_state == TerminalState::SUCCESS, "undefined_var repaired");

        s = orch.repair("import mender_no_such_module_xyz\nprint('ok')\n", 3);
        expect_true(s.terminal_state == TerminalState::SUCCESS, "missing import disabled");
        expect_eq_str(s.executions.back().stdout_text, "ok\n", "rest of program ran");

        s = orch.repair("def f():\nreturn 5\nprint(f())\n", 3);
        expect_true(s.terminal_state == TerminalState::SUCCESS, "indentation repaired");

        s = orch.repair("print(\n", 3);
        expect_true(s.terminal_state == TerminalState::NON_RECOVERABLE, "syntax errors stop the loop");
        expect_eq_ll(s.total_iterations, 1, "after one execution");
    }

    std::error_code ec;
    fs::remove_all(root, ec);
    std::cerr << "test_executor: ALL PASSED" << std::endl;
    return 0;
}
