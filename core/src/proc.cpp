#include "mender/proc.h"
#include "mender/sandbox.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <chrono>
#include <sstream>

#ifndef _WIN32
  #include <unistd.h>
  #include <fcntl.h>
  #include <signal.h>
  #include <sys/stat.h>
  #include <sys/types.h>
  #include <sys/wait.h>
  #include <sys/resource.h>
  #include <poll.h>
  #include <pthread.h>
  #include <time.h>
  #ifdef __linux__
    #include <sys/prctl.h>
  #endif
#endif

namespace mender {

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;
    bool have_tok = false;

    auto flush = [&]() {
        if (have_tok) {
            out.push_back(cur);
            cur.clear();
            have_tok = false;
        }
    };

    for (size_t i = 0; i < cmd.size(); i++) {
        char c = cmd[i];
        if (st == NORM) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                flush();
                continue;
            }
            if (c == '\'') { st = SQ; have_tok = true; continue; }
            if (c == '"') { st = DQ; esc = false; have_tok = true; continue; }
            cur.push_back(c);
            have_tok = true;
        } else if (st == SQ) {
            if (c == '\'') { st = NORM; continue; }
            cur.push_back(c);
        } else { // DQ
            if (esc) {
                cur.push_back(c);
                esc = false;
                continue;
            }
            if (c == '\\') { esc = true; continue; }
            if (c == '"') { st = NORM; continue; }
            cur.push_back(c);
        }
    }
    if (st != NORM) return {};
    flush();
    return out;
}

std::string find_executable(const std::string& name) {
#ifdef _WIN32
    return name;
#else
    if (name.empty()) return "";
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0 ? name : "";
    }
    const char* path = std::getenv("PATH");
    std::string p = path ? path : "/usr/local/bin:/usr/bin:/bin";
    std::istringstream iss(p);
    std::string dir;
    while (std::getline(iss, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string cand = dir + "/" + name;
        if (access(cand.c_str(), X_OK) == 0) return cand;
    }
    return "";
#endif
}

#ifndef _WIN32
extern "C" char** environ;

namespace {

void set_rlimit(int resource, rlim_t soft, rlim_t hard) {
    struct rlimit rl;
    rl.rlim_cur = soft;
    rl.rlim_max = hard;
    (void)setrlimit(resource, &rl);
}

// Everything the child needs, prepared before fork() so the child only
// issues system calls (the parent may have other threads holding locks).
struct ExecPlan {
    std::vector<std::string> argv;
    std::vector<char*> cargv;
    std::vector<std::string> env;
    std::vector<char*> cenv;
    std::string exe;
};

void build_plan(const std::vector<std::string>& argv, const ProcLimits& lim, ExecPlan* plan) {
    plan->argv.reserve(lim.wrapper.size() + argv.size());
    plan->argv.insert(plan->argv.end(), lim.wrapper.begin(), lim.wrapper.end());
    plan->argv.insert(plan->argv.end(), argv.begin(), argv.end());
    plan->cargv.reserve(plan->argv.size() + 1);
    for (const auto& s : plan->argv) plan->cargv.push_back(const_cast<char*>(s.c_str()));
    plan->cargv.push_back(nullptr);

    if (lim.env) {
        plan->env = *lim.env;
    } else {
        // inherit, minus dangerous loader env vars
        for (char** e = environ; e && *e; ++e) {
            std::string kv = *e;
            if (kv.rfind("LD_PRELOAD=", 0) == 0 || kv.rfind("LD_LIBRARY_PATH=", 0) == 0) continue;
            plan->env.push_back(std::move(kv));
        }
    }
    plan->cenv.reserve(plan->env.size() + 1);
    for (const auto& s : plan->env) plan->cenv.push_back(const_cast<char*>(s.c_str()));
    plan->cenv.push_back(nullptr);
    plan->exe = find_executable(plan->argv[0]);
    if (plan->exe.empty()) plan->exe = plan->argv[0];
}

// Runs in the forked child between fork() and exec(). Never returns.
[[noreturn]] void exec_child(const ExecPlan& plan, const std::string& cwd, const ProcLimits& lim) {
    // isolate process group so timeout can kill the whole subtree
    (void)setpgid(0, 0);

    // tighten default file permissions for any files created by the child
    (void)umask(077);

    // best-effort: close inherited fds beyond stdin/stdout/stderr
    long maxfd = sysconf(_SC_OPEN_MAX);
    if (maxfd < 256) maxfd = 256;
    for (int fd = 3; fd < maxfd; fd++) {
        (void)close(fd);
    }

    if (!cwd.empty()) {
        if (chdir(cwd.c_str()) != 0) _exit(126);
    }

#ifdef __linux__
    if (lim.no_new_privs) {
        (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
    }
    (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif

    if (lim.nice_level > 0) {
        (void)setpriority(PRIO_PROCESS, 0, std::min(lim.nice_level, 19));
    }
    if (lim.rlimit_cpu_sec > 0) {
        // soft limit delivers SIGXCPU, hard limit one second later SIGKILL
        set_rlimit(RLIMIT_CPU, (rlim_t)lim.rlimit_cpu_sec, (rlim_t)lim.rlimit_cpu_sec + 1);
    }
    if (lim.rlimit_as_bytes > 0) {
        set_rlimit(RLIMIT_AS, (rlim_t)lim.rlimit_as_bytes, (rlim_t)lim.rlimit_as_bytes);
    }
    if (lim.rlimit_fsize_mb > 0) {
        rlim_t bytes = (rlim_t)lim.rlimit_fsize_mb * 1024ULL * 1024ULL;
        set_rlimit(RLIMIT_FSIZE, bytes, bytes);
    }
    if (lim.rlimit_nofile > 0) {
        set_rlimit(RLIMIT_NOFILE, (rlim_t)lim.rlimit_nofile, (rlim_t)lim.rlimit_nofile);
    }
#ifdef RLIMIT_NPROC
    if (lim.rlimit_nproc > 0) {
        set_rlimit(RLIMIT_NPROC, (rlim_t)lim.rlimit_nproc, (rlim_t)lim.rlimit_nproc);
    }
#endif

    // seccomp must come after no_new_privs; a filter that fails to install
    // must not leave an untrusted child with network access
    if (lim.deny_network) {
        if (install_network_deny_filter_raw() != 0) {
            (void)!write(STDERR_FILENO, kFilterInstallFailed, sizeof(kFilterInstallFailed) - 1);
            _exit(126);
        }
    }

    execve(plan.exe.c_str(), plan.cargv.data(), plan.cenv.data());
    _exit(127);
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

// Bounded append shared by stdout and stderr capture.
void append_bounded(std::string& dst, const char* buf, ssize_t n, size_t cap, bool* truncated) {
    size_t can = cap > dst.size() ? (cap - dst.size()) : 0;
    if (can == 0) {
        *truncated = true;
        return;
    }
    size_t take = (size_t)n;
    if (take > can) {
        take = can;
        *truncated = true;
    }
    dst.append(buf, buf + take);
}

bool run_impl(const std::vector<std::string>& argv,
              const std::string& cwd,
              const std::string* stdin_data,
              const ProcLimits& lim,
              ProcResult* res) {
    if (argv.empty() || argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }

    int out_pipe[2];
    if (pipe(out_pipe) != 0) {
        res->error = std::string("pipe(out) failed: ") + std::strerror(errno);
        return false;
    }
    int err_pipe[2] = {-1, -1};
    if (!lim.merge_stderr && pipe(err_pipe) != 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        res->error = std::string("pipe(err) failed: ") + std::strerror(errno);
        return false;
    }
    int in_pipe[2] = {-1, -1};
    if (stdin_data && pipe(in_pipe) != 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        if (err_pipe[0] >= 0) { close(err_pipe[0]); close(err_pipe[1]); }
        res->error = std::string("pipe(in) failed: ") + std::strerror(errno);
        return false;
    }

    auto close_all = [&]() {
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1], in_pipe[0], in_pipe[1]}) {
            if (fd >= 0) close(fd);
        }
    };

    ExecPlan plan;
    build_plan(argv, lim, &plan);

    // block SIGPIPE in this thread while writing stdin to a child that may
    // exit early; the child gets the original mask back before exec
    sigset_t pipe_set, old_mask;
    sigemptyset(&pipe_set);
    sigaddset(&pipe_set, SIGPIPE);
    (void)pthread_sigmask(SIG_BLOCK, &pipe_set, &old_mask);
    auto restore_mask = [&]() {
        struct timespec zero{0, 0};
        while (sigtimedwait(&pipe_set, nullptr, &zero) > 0) {}
        (void)pthread_sigmask(SIG_SETMASK, &old_mask, nullptr);
    };

    auto start = std::chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid < 0) {
        close_all();
        restore_mask();
        res->error = std::string("fork failed: ") + std::strerror(errno);
        return false;
    }

    if (pid == 0) {
        // child
        if (in_pipe[0] >= 0) {
            (void)dup2(in_pipe[0], STDIN_FILENO);
        } else {
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) { (void)dup2(devnull, STDIN_FILENO); close(devnull); }
        }
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        (void)dup2(lim.merge_stderr ? out_pipe[1] : err_pipe[1], STDERR_FILENO);
        (void)sigprocmask(SIG_SETMASK, &old_mask, nullptr);
        exec_child(plan, cwd, lim);
    }

    // parent
    (void)setpgid(pid, pid);
    close(out_pipe[1]); out_pipe[1] = -1;
    if (err_pipe[1] >= 0) { close(err_pipe[1]); err_pipe[1] = -1; }
    if (in_pipe[0] >= 0) { close(in_pipe[0]); in_pipe[0] = -1; }

    set_nonblocking(out_pipe[0]);
    if (err_pipe[0] >= 0) set_nonblocking(err_pipe[0]);

    int in_fd = in_pipe[1];
    in_pipe[1] = -1;
    if (in_fd >= 0) {
        if (stdin_data->empty()) {
            close(in_fd);
            in_fd = -1;
        } else {
            set_nonblocking(in_fd);
        }
    }
    size_t write_off = 0;

    std::string out, err;
    out.reserve(std::min<size_t>(lim.stdout_max_bytes, 64 * 1024));

    auto drain = [&](int fd, std::string& dst) {
        char buf[4096];
        while (true) {
            ssize_t n = read(fd, buf, sizeof(buf));
            if (n > 0) { append_bounded(dst, buf, n, lim.stdout_max_bytes, &res->output_truncated); continue; }
            if (n == -1 && errno == EINTR) continue;
            break; // EAGAIN, EOF or error
        }
    };

    bool child_exited = false;
    int status = 0;

    while (true) {
        struct pollfd fds[3];
        nfds_t nfds = 0;
        int in_idx = -1, out_idx = -1, err_idx = -1;
        if (in_fd >= 0) {
            in_idx = (int)nfds;
            fds[nfds].fd = in_fd; fds[nfds].events = POLLOUT; fds[nfds].revents = 0; nfds++;
        }
        out_idx = (int)nfds;
        fds[nfds].fd = out_pipe[0]; fds[nfds].events = POLLIN; fds[nfds].revents = 0; nfds++;
        if (err_pipe[0] >= 0) {
            err_idx = (int)nfds;
            fds[nfds].fd = err_pipe[0]; fds[nfds].events = POLLIN; fds[nfds].revents = 0; nfds++;
        }

        int elapsed_ms = (int)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        int slice = 50;
        if (lim.timeout_ms > 0) {
            int remaining = lim.timeout_ms - elapsed_ms;
            if (remaining <= 0) {
                res->timed_out = true;
                // kill process group first (best-effort), then the direct pid
                (void)kill(-pid, SIGKILL);
                (void)kill(pid, SIGKILL);
                (void)waitpid(pid, &status, 0);
                child_exited = true;
                break;
            }
            if (remaining < slice) slice = remaining;
        }

        int pr = poll(fds, nfds, slice);
        if (pr < 0 && errno == EINTR) continue;

        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            while (write_off < stdin_data->size()) {
                ssize_t n = write(in_fd, stdin_data->data() + write_off, stdin_data->size() - write_off);
                if (n > 0) { write_off += (size_t)n; continue; }
                if (n == -1 && errno == EINTR) continue;
                if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
                write_off = stdin_data->size(); // EPIPE or other error: stop writing
                break;
            }
            if (write_off >= stdin_data->size()) {
                close(in_fd);
                in_fd = -1;
            }
        }

        if (fds[out_idx].revents & (POLLIN | POLLERR | POLLHUP)) drain(out_pipe[0], out);
        if (err_idx >= 0 && (fds[err_idx].revents & (POLLIN | POLLERR | POLLHUP))) drain(err_pipe[0], err);

        // detect the exit without reaping, so the group id stays valid for the kill
        siginfo_t si;
        std::memset(&si, 0, sizeof(si));
        if (waitid(P_PID, (id_t)pid, &si, WEXITED | WNOHANG | WNOWAIT) == 0 && si.si_pid == pid) {
            // background children of the program die with it
            (void)kill(-pid, SIGKILL);
            (void)waitpid(pid, &status, 0);
            child_exited = true;
            break;
        }
    }

    if (in_fd >= 0) close(in_fd);

    // drain any remaining output
    drain(out_pipe[0], out);
    close(out_pipe[0]);
    if (err_pipe[0] >= 0) {
        drain(err_pipe[0], err);
        close(err_pipe[0]);
    }
    restore_mask();

    res->elapsed_sec = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    res->output = std::move(out);
    res->err_output = std::move(err);
    if (!child_exited) {
        res->exit_code = 128;
        res->error = "child did not exit";
        return true;
    }

    if (WIFEXITED(status)) {
        res->exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        res->term_signal = WTERMSIG(status);
        res->exit_code = 128 + res->term_signal;
    } else {
        res->exit_code = 128;
    }
    return true;
}

} // namespace
#endif

bool proc_run_capture_sandboxed(const std::vector<std::string>& argv,
                               const std::string& cwd,
                               const ProcLimits& lim,
                               ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};
#ifdef _WIN32
    res->error = "proc_run_capture_sandboxed: not supported on Windows";
    return false;
#else
    return run_impl(argv, cwd, nullptr, lim, res);
#endif
}

bool proc_run_capture_sandboxed_stdin(const std::vector<std::string>& argv,
                                     const std::string& cwd,
                                     const std::string& stdin_data,
                                     const ProcLimits& lim,
                                     ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};
#ifdef _WIN32
    res->error = "proc_run_capture_sandboxed_stdin: not supported on Windows";
    return false;
#else
    return run_impl(argv, cwd, &stdin_data, lim, res);
#endif
}

} // namespace mender
