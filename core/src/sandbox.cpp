#include "cordon/sandbox.h"

#if defined(__linux__)

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <sys/prctl.h>
#include <sys/syscall.h>

// Architecture-specific audit arch constant
#if defined(__x86_64__)
  #define CORDON_AUDIT_ARCH AUDIT_ARCH_X86_64
#elif defined(__aarch64__)
  #define CORDON_AUDIT_ARCH AUDIT_ARCH_AARCH64
#else
  #define CORDON_AUDIT_ARCH 0
#endif

// BPF helpers
#define BPF_STMT_SC(code, k) { (unsigned short)(code), 0, 0, (unsigned int)(k) }
#define BPF_JUMP_SC(code, k, jt, jf) { (unsigned short)(code), (unsigned char)(jt), (unsigned char)(jf), (unsigned int)(k) }

namespace cordon {

std::string install_seccomp_filter() {
#if CORDON_AUDIT_ARCH == 0
    return "seccomp: unsupported architecture";
#else
    // The interpreter only allocates, writes its streams and exits.
    static const unsigned int allowed[] = {
        // I/O on already-open descriptors
        __NR_read,
        __NR_write,
        __NR_writev,
        __NR_close,
        __NR_lseek,
        __NR_fstat,
#ifdef __NR_newfstatat
        __NR_newfstatat,
#endif
        // memory
        __NR_mmap,
        __NR_mprotect,   // filtered separately for PROT_EXEC
        __NR_munmap,
        __NR_mremap,
        __NR_brk,
        __NR_madvise,
        // signals (abort path included)
        __NR_rt_sigaction,
        __NR_rt_sigprocmask,
        __NR_rt_sigreturn,
        __NR_sigaltstack,
        __NR_getpid,
        __NR_gettid,
        __NR_tgkill,
        // runtime
        __NR_futex,
        __NR_clock_gettime,
        __NR_gettimeofday,
        __NR_getrandom,
        __NR_exit,
        __NR_exit_group,
    };

    std::vector<unsigned int> allowlist(allowed, allowed + (sizeof(allowed) / sizeof(allowed[0])));
    const size_t n_allowed = allowlist.size();
    const unsigned int mprotect_nr = __NR_mprotect;

    // Layout:
    //   [0]                 load arch
    //   [1]                 JEQ arch -> skip kill
    //   [2]                 KILL (arch mismatch)
    //   [3]                 load syscall nr
    //   [4..4+N-1]          JEQ allowed[s] -> ALLOW or MPROTECT_CHECK
    //   [4+N]               KILL (default deny)
    //   [4+N+1]             MPROTECT_CHECK: load arg2 (prot)
    //   [4+N+2]             JSET PROT_EXEC -> KILL
    //   [4+N+3]             ALLOW (mprotect without PROT_EXEC)
    //   [4+N+4]             KILL (mprotect with PROT_EXEC)
    //   [4+N+5]             ALLOW
    const size_t total_insns = 4 + n_allowed + 6;
    std::vector<struct sock_filter> filter;
    filter.reserve(total_insns);

    filter.push_back(BPF_STMT_SC(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch)));
    filter.push_back(BPF_JUMP_SC(BPF_JMP | BPF_JEQ | BPF_K, CORDON_AUDIT_ARCH, 1, 0));
    filter.push_back(BPF_STMT_SC(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    filter.push_back(BPF_STMT_SC(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr)));

    for (size_t s = 0; s < n_allowed; s++) {
        // jump targets are relative to the next instruction
        unsigned char jt = allowlist[s] == mprotect_nr ? (unsigned char)(n_allowed - s)
                                                       : (unsigned char)(n_allowed + 4 - s);
        filter.push_back(BPF_JUMP_SC(BPF_JMP | BPF_JEQ | BPF_K, allowlist[s], jt, 0));
    }

    filter.push_back(BPF_STMT_SC(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    filter.push_back(BPF_STMT_SC(BPF_LD | BPF_W | BPF_ABS,
                                 offsetof(struct seccomp_data, args) + 2 * sizeof(uint64_t)));
    filter.push_back(BPF_JUMP_SC(BPF_JMP | BPF_JSET | BPF_K, 0x4, 1, 0));
    filter.push_back(BPF_STMT_SC(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));
    filter.push_back(BPF_STMT_SC(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    filter.push_back(BPF_STMT_SC(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));

    struct sock_fprog prog = {};
    prog.len = (unsigned short)filter.size();
    prog.filter = filter.data();

    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog, 0, 0) != 0) {
        return std::string("seccomp install failed: ") + std::strerror(errno);
    }
    return "";
#endif
}

bool seccomp_available() {
    // 0: available and not active, 2: filter mode active, -1/EINVAL: unsupported
    int ret = prctl(PR_GET_SECCOMP, 0, 0, 0, 0);
    return ret >= 0;
}

} // namespace cordon

#else // !__linux__

namespace cordon {

std::string install_seccomp_filter() {
    return "seccomp: not supported on this platform";
}

bool seccomp_available() {
    return false;
}

} // namespace cordon

#endif
