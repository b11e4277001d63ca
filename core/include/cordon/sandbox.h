#pragma once

// Cordon Sandbox: seccomp-BPF syscall allowlist for the interpreter cell.
//
// Allowlist-only. Any syscall NOT on the list kills the process with SIGSYS.
// Installed by cordon_cell after it has read its request and before it parses
// the submitted program.
//
// Architecture-aware: x86_64 and aarch64.

#include <string>

namespace cordon {

// Install a seccomp-BPF filter restricting the calling process to what a
// running interpreter needs. Must be called AFTER prctl(PR_SET_NO_NEW_PRIVS, 1).
//
// Allowed: read, write, writev, close, lseek, fstat, mmap, mprotect(non-exec),
// munmap, mremap, brk, madvise, rt_sigaction, rt_sigprocmask, rt_sigreturn,
// sigaltstack, futex, clock_gettime, gettimeofday, getrandom, getpid, gettid,
// tgkill (abort), exit, exit_group.
//
// BLOCKED (notable): open, openat, socket family, clone, fork, execve, kill,
// ptrace, mount, prctl, setrlimit/prlimit64, unshare, setns.
//
// Returns empty string on success, error message on failure.
// On non-Linux platforms, returns an error (the filter cannot be provided).
std::string install_seccomp_filter();

// Check if seccomp is available on this system.
bool seccomp_available();

} // namespace cordon
