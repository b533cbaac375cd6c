#include "test_common.h"
#include "mender/proc.h"

#include <chrono>
#include <cstdlib>
#include <csignal>

using namespace mender;

int main() {
    // argv splitting
    {
        auto v = split_argv_quoted("python3 'my model.py' --name \"a \\\"b\\\"\"");
        expect_eq_ll((long long)v.size(), 4, "four tokens");
        expect_eq_str(v[1], "my model.py", "single quotes");
        expect_eq_str(v[2], "--name", "plain");
        expect_eq_str(v[3], "a \"b\"", "escaped quotes inside double quotes");
        expect_true(split_argv_quoted("echo 'unterminated").empty(), "parse error gives empty argv");
    }

    const std::string sh = find_executable("sh");
    if (sh.empty()) {
        std::cerr << "test_proc: SKIPPED (sh not found)" << std::endl;
        return 0;
    }
    expect_true(find_executable("definitely-not-a-real-binary-xyz").empty(), "missing binary");

    ProcLimits lim;
    lim.timeout_ms = 5000;
    lim.merge_stderr = false;
    lim.rlimit_nproc = 0;

    // stdout and stderr captured separately, exit code reported
    {
        ProcResult pr;
        expect_true(proc_run_capture_sandboxed({sh, "-c", "echo out; echo err >&2; exit 3"}, "", lim, &pr), "started");
        expect_eq_str(pr.output, "out\n", "stdout");
        expect_eq_str(pr.err_output, "err\n", "stderr");
        expect_eq_ll(pr.exit_code, 3, "exit code");
        expect_true(!pr.timed_out, "not timed out");
    }

    // Wall-clock timeout kills the whole process group
    {
        ProcLimits t = lim;
        t.timeout_ms = 300;
        ProcResult pr;
        const auto t0 = std::chrono::steady_clock::now();
        proc_run_capture_sandboxed({sh, "-c", "echo started; sleep 30 & sleep 30"}, "", t, &pr);
        const double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
        expect_true(pr.timed_out, "timed out");
        expect_true(secs < 5.0, "killed promptly");
        expect_eq_ll(pr.term_signal, SIGKILL, "SIGKILL");
        expect_eq_str(pr.output, "started\n", "partial stdout kept");
    }

    // Background children do not outlive a normal exit
    {
        ProcResult pr;
        expect_true(proc_run_capture_sandboxed({sh, "-c", "sleep 30 & echo $!"}, "", lim, &pr), "started");
        expect_eq_ll(pr.exit_code, 0, "shell exited normally");
        expect_true(!pr.timed_out, "no timeout involved");
        const long child = std::atol(pr.output.c_str());
        expect_true(child > 0, "background pid printed: " + pr.output);
        expect_true(wait_process_gone(child), "background sleep killed with the group");
    }

    // Output cap
    {
        ProcLimits t = lim;
        t.stdout_max_bytes = 10;
        ProcResult pr;
        proc_run_capture_sandboxed({sh, "-c", "i=0; while [ $i -lt 100 ]; do echo 0123456789; i=$((i+1)); done"}, "", t, &pr);
        expect_true(pr.output_truncated, "truncated");
        expect_eq_ll((long long)pr.output.size(), 10, "capped");
    }

    // Scrubbed environment and working directory
    {
        ProcLimits t = lim;
        t.env = std::vector<std::string>{"PATH=/usr/bin:/bin", "MENDER_PROBE=yes"};
        ProcResult pr;
        proc_run_capture_sandboxed({sh, "-c", "echo $MENDER_PROBE:${HOME:-none}; pwd"}, "/", t, &pr);
        expect_eq_str(pr.output, "yes:none\n/\n", "only the given env; cwd applied");
    }

    // stdin payload larger than a pipe buffer
    {
        std::string big(256 * 1024, 'x');
        ProcLimits t = lim;
        t.stdout_max_bytes = 1024;
        ProcResult pr;
        expect_true(proc_run_capture_sandboxed_stdin({sh, "-c", "wc -c"}, "", big, t, &pr), "started");
        expect_true(contains(pr.output, "262144"), "all stdin delivered: " + pr.output);
    }

    // Missing executable: child exits 127
    {
        ProcResult pr;
        proc_run_capture_sandboxed({"/nonexistent/python3"}, "", lim, &pr);
        expect_eq_ll(pr.exit_code, 127, "exec failure");
    }

    // Wrapper prefix is prepended
    {
        ProcLimits t = lim;
        t.wrapper = {sh, "-c", "echo wrapped \"$0\"", "--"};
        ProcResult pr;
        proc_run_capture_sandboxed({"payload"}, "", t, &pr);
        expect_eq_str(pr.output, "wrapped --\n", "wrapper ran first");
    }

    std::cerr << "test_proc: ALL PASSED" << std::endl;
    return 0;
}
