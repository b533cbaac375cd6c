#include "mender/sandbox.h"

#include <cerrno>
#include <cstring>

#if defined(__linux__)

#include <cstddef>
#include <cstdint>

#include <linux/filter.h>
#include <linux/seccomp.h>
#include <linux/audit.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <sys/syscall.h>

// Architecture-specific audit arch constant
#if defined(__x86_64__)
  #define MENDER_AUDIT_ARCH AUDIT_ARCH_X86_64
#elif defined(__aarch64__)
  #define MENDER_AUDIT_ARCH AUDIT_ARCH_AARCH64
#else
  #define MENDER_AUDIT_ARCH 0
#endif

// Low 32 bits of a 64-bit syscall argument inside seccomp_data.
#if __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
  #define MENDER_ARG_LO(n) (offsetof(struct seccomp_data, args) + (n) * sizeof(uint64_t))
#else
  #define MENDER_ARG_LO(n) (offsetof(struct seccomp_data, args) + (n) * sizeof(uint64_t) + sizeof(uint32_t))
#endif

// BPF helpers
#define BPF_STMT_SC(code, k) { (unsigned short)(code), 0, 0, (unsigned int)(k) }
#define BPF_JUMP_SC(code, k, jt, jf) { (unsigned short)(code), (unsigned char)(jt), (unsigned char)(jf), (unsigned int)(k) }

#define MENDER_RET_DENY (SECCOMP_RET_ERRNO | (EACCES & SECCOMP_RET_DATA))

namespace mender {

int install_network_deny_filter_raw() {
#if MENDER_AUDIT_ARCH == 0
    return ENOSYS;
#else
    // Layout:
    //   [0] load arch
    //   [1] arch == native ? skip : deny
    //   [2] deny
    //   [3] load nr
    //   [4] x32 bit set ? deny : continue           (x86_64 only, else no-op jump)
    //   [5] nr == io_uring_setup ? deny : continue
    //   [6] nr == socket ? check domain : allow
    //   [7] allow
    //   [8] load args[0] (domain)
    //   [9] domain == AF_UNIX ? allow : deny
    //   [10] deny
    //   [11] allow
#if defined(__x86_64__)
    const unsigned int x32_bit = 0x40000000u;
#else
    const unsigned int x32_bit = 0xffffffffu; // never matches a real nr
#endif
#if defined(__NR_io_uring_setup)
    const unsigned int nr_io_uring_setup = __NR_io_uring_setup;
#else
    const unsigned int nr_io_uring_setup = 0xfffffffeu;
#endif

    struct sock_filter filter[] = {
        /* 0 */ BPF_STMT_SC(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch)),
        /* 1 */ BPF_JUMP_SC(BPF_JMP | BPF_JEQ | BPF_K, MENDER_AUDIT_ARCH, 1, 0),
        /* 2 */ BPF_STMT_SC(BPF_RET | BPF_K, MENDER_RET_DENY),
        /* 3 */ BPF_STMT_SC(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr)),
        /* 4 */ BPF_JUMP_SC(BPF_JMP | BPF_JGE | BPF_K, x32_bit, 5, 0),
        /* 5 */ BPF_JUMP_SC(BPF_JMP | BPF_JEQ | BPF_K, nr_io_uring_setup, 4, 0),
        /* 6 */ BPF_JUMP_SC(BPF_JMP | BPF_JEQ | BPF_K, __NR_socket, 1, 0),
        /* 7 */ BPF_STMT_SC(BPF_RET | BPF_K, SECCOMP_RET_ALLOW),
        /* 8 */ BPF_STMT_SC(BPF_LD | BPF_W | BPF_ABS, MENDER_ARG_LO(0)),
        /* 9 */ BPF_JUMP_SC(BPF_JMP | BPF_JEQ | BPF_K, AF_UNIX, 1, 0),
        /* 10 */ BPF_STMT_SC(BPF_RET | BPF_K, MENDER_RET_DENY),
        /* 11 */ BPF_STMT_SC(BPF_RET | BPF_K, SECCOMP_RET_ALLOW),
    };

    struct sock_fprog prog = {};
    prog.len = (unsigned short)(sizeof(filter) / sizeof(filter[0]));
    prog.filter = filter;

    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog, 0, 0) != 0) {
        return errno != 0 ? errno : EINVAL;
    }
    return 0;
#endif
}

bool seccomp_available() {
    // ret == 0: seccomp not active but available; ret == 2: filter mode active;
    // ret == -1 && errno == EINVAL: not supported
    int ret = prctl(PR_GET_SECCOMP, 0, 0, 0, 0);
    return (ret >= 0) && MENDER_AUDIT_ARCH != 0;
}

} // namespace mender

#else // !__linux__

namespace mender {

int install_network_deny_filter_raw() {
    return ENOSYS;
}

bool seccomp_available() {
    return false;
}

} // namespace mender

#endif

namespace mender {

std::string install_network_deny_filter() {
    int err = install_network_deny_filter_raw();
    if (err == 0) return "";
    return std::string("seccomp install failed: ") + std::strerror(err);
}

} // namespace mender
