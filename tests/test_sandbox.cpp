#include "test_common.h"
#include "mender/sandbox.h"

#ifdef __linux__
#include <cerrno>
#include <unistd.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/wait.h>
#endif

#ifdef __linux__
// Fork, install the filter, run body in the child; the child's exit code is returned.
template <class F>
static int in_filtered_child(F body) {
    pid_t pid = fork();
    if (pid == 0) {
        prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
        if (mender::install_network_deny_filter_raw() != 0) _exit(100);
        _exit(body());
    }
    int status = 0;
    waitpid(pid, &status, 0);
    return WIFEXITED(status) ? WEXITSTATUS(status) : 200;
}
#endif

int main() {
    bool avail = mender::seccomp_available();
#ifndef __linux__
    expect_true(!avail, "seccomp should not be available on non-Linux");
    expect_true(!mender::install_network_deny_filter().empty(), "install reports ENOSYS off Linux");
#else
    if (!avail) {
        std::cerr << "test_sandbox: SKIPPED (seccomp unavailable)" << std::endl;
        return 0;
    }

    // Ordinary I/O keeps working under the filter
    expect_eq_ll(in_filtered_child([] {
                     const char* msg = "seccomp_ok\n";
                     return write(STDOUT_FILENO, msg, 11) == 11 ? 0 : 2;
                 }),
                 0, "write allowed");

    // Internet sockets are refused with EACCES, not a kill
    expect_eq_ll(in_filtered_child([] {
                     int fd = socket(AF_INET, SOCK_STREAM, 0);
                     if (fd >= 0) return 3;
                     return errno == EACCES ? 0 : 4;
                 }),
                 0, "AF_INET denied");
    expect_eq_ll(in_filtered_child([] {
                     int fd = socket(AF_INET6, SOCK_DGRAM, 0);
                     return (fd < 0 && errno == EACCES) ? 0 : 5;
                 }),
                 0, "AF_INET6 denied");

    // Local sockets stay available
    expect_eq_ll(in_filtered_child([] {
                     int fd = socket(AF_UNIX, SOCK_STREAM, 0);
                     if (fd < 0) return 6;
                     close(fd);
                     return 0;
                 }),
                 0, "AF_UNIX allowed");
#endif

    std::cerr << "test_sandbox: ALL PASSED" << std::endl;
    return 0;
}
