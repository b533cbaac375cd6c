#pragma once

// Mender Sandbox — seccomp-BPF network denial for untrusted children.
//
// Design: allow everything except the ways a process can obtain a network
// endpoint. socket() is allowed only for AF_UNIX; io_uring setup is denied
// because IORING_OP_SOCKET bypasses the socket() check. Denied calls fail
// with EACCES instead of killing the interpreter, so the program sees an
// ordinary error (and a traceback) when it tries to reach the network.
//
// Architecture-aware: supports x86_64 and aarch64. Foreign-ABI syscalls
// (x32, compat) are denied outright.

#include <string>

namespace mender {

// Install the filter on the calling process. Must be called AFTER
// prctl(PR_SET_NO_NEW_PRIVS, 1). Async-signal-safe: usable between fork()
// and exec(). Returns 0 on success, an errno value on failure.
// On non-Linux platforms, returns ENOSYS.
int install_network_deny_filter_raw();

// Same as above; returns empty string on success, error message on failure.
std::string install_network_deny_filter();

// Check if seccomp is available on this system.
bool seccomp_available();

} // namespace mender
