#include "scrapeguard/sandbox.h"

namespace scrapeguard {

const char* seccomp_profile_name(SeccompProfile p) {
    return p == SeccompProfile::NET ? "net" : "strict";
}

SeccompProfile seccomp_profile_from_string(const std::string& s) {
    return s == "net" ? SeccompProfile::NET : SeccompProfile::STRICT;
}

} // namespace scrapeguard

#if defined(__linux__)

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <vector>

#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <sys/mman.h>
#include <sys/prctl.h>
#include <sys/syscall.h>

#if defined(__x86_64__)
  #define SCRAPEGUARD_AUDIT_ARCH AUDIT_ARCH_X86_64
#elif defined(__aarch64__)
  #define SCRAPEGUARD_AUDIT_ARCH AUDIT_ARCH_AARCH64
#else
  #define SCRAPEGUARD_AUDIT_ARCH 0
#endif

namespace scrapeguard {

namespace {

// Numbers come from <sys/syscall.h>, so the same list serves x86_64 and
// aarch64; legacy calls that only one architecture has are guarded.
const long kBaseSyscalls[] = {
    SYS_read, SYS_write, SYS_close, SYS_fstat, SYS_lseek,
    SYS_mmap, SYS_munmap, SYS_brk, SYS_mremap, SYS_madvise,
    SYS_rt_sigaction, SYS_rt_sigprocmask, SYS_rt_sigreturn, SYS_sigaltstack,
    SYS_ioctl, SYS_pread64, SYS_pwrite64, SYS_readv, SYS_writev,
    SYS_dup, SYS_dup3, SYS_pipe2, SYS_ppoll, SYS_pselect6,
    SYS_sched_yield, SYS_sched_getaffinity, SYS_nanosleep, SYS_clock_nanosleep,
    SYS_clock_gettime, SYS_clock_getres, SYS_gettimeofday,
    SYS_getpid, SYS_getppid, SYS_gettid, SYS_getuid, SYS_geteuid, SYS_getgid, SYS_getegid,
    SYS_clone, SYS_execve, SYS_wait4, SYS_exit, SYS_exit_group, SYS_kill, SYS_tgkill,
    SYS_uname, SYS_fcntl, SYS_getcwd, SYS_chdir, SYS_umask, SYS_getdents64,
    SYS_openat, SYS_newfstatat, SYS_readlinkat, SYS_faccessat, SYS_unlinkat, SYS_mkdirat,
    SYS_getrlimit, SYS_prlimit64, SYS_sysinfo, SYS_prctl,
    SYS_futex, SYS_set_tid_address, SYS_set_robust_list, SYS_getrandom,
    SYS_epoll_create1, SYS_epoll_ctl, SYS_epoll_pwait, SYS_eventfd2,
#ifdef SYS_open
    SYS_open,
#endif
#ifdef SYS_stat
    SYS_stat, SYS_lstat,
#endif
#ifdef SYS_poll
    SYS_poll,
#endif
#ifdef SYS_select
    SYS_select,
#endif
#ifdef SYS_pipe
    SYS_pipe,
#endif
#ifdef SYS_dup2
    SYS_dup2,
#endif
#ifdef SYS_access
    SYS_access,
#endif
#ifdef SYS_readlink
    SYS_readlink,
#endif
#ifdef SYS_unlink
    SYS_unlink,
#endif
#ifdef SYS_getdents
    SYS_getdents,
#endif
#ifdef SYS_epoll_wait
    SYS_epoll_wait,
#endif
#ifdef SYS_arch_prctl
    SYS_arch_prctl,
#endif
#ifdef SYS_vfork
    SYS_vfork,
#endif
#ifdef SYS_statx
    SYS_statx,
#endif
#ifdef SYS_faccessat2
    SYS_faccessat2,
#endif
#ifdef SYS_rseq
    SYS_rseq,
#endif
};

const long kNetSyscalls[] = {
    SYS_socket, SYS_connect, SYS_sendto, SYS_recvfrom, SYS_sendmsg, SYS_recvmsg,
    SYS_shutdown, SYS_getsockname, SYS_getpeername, SYS_setsockopt, SYS_getsockopt,
    SYS_socketpair,
#ifdef SYS_sendmmsg
    SYS_sendmmsg,
#endif
#ifdef SYS_recvmmsg
    SYS_recvmmsg,
#endif
};

sock_filter stmt(uint16_t code, uint32_t k) {
    return sock_filter{code, 0, 0, k};
}

sock_filter jump(uint16_t code, uint32_t k, uint8_t jt, uint8_t jf) {
    return sock_filter{code, jt, jf, k};
}

} // namespace

std::string install_seccomp_filter(SeccompProfile profile) {
#if SCRAPEGUARD_AUDIT_ARCH == 0
    (void)profile;
    return "seccomp: unsupported architecture";
#else
    std::vector<long> allow(std::begin(kBaseSyscalls), std::end(kBaseSyscalls));
    if (profile == SeccompProfile::NET) {
        allow.insert(allow.end(), std::begin(kNetSyscalls), std::end(kNetSyscalls));
    }

    std::vector<sock_filter> prog;
    prog.reserve(allow.size() + 16);

    prog.push_back(stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(seccomp_data, arch)));
    prog.push_back(jump(BPF_JMP | BPF_JEQ | BPF_K, SCRAPEGUARD_AUDIT_ARCH, 1, 0));
    prog.push_back(stmt(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    prog.push_back(stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(seccomp_data, nr)));

    // mprotect: allowed only without PROT_EXEC.
    prog.push_back(jump(BPF_JMP | BPF_JEQ | BPF_K, SYS_mprotect, 0, 4));
    prog.push_back(stmt(BPF_LD | BPF_W | BPF_ABS,
                        offsetof(seccomp_data, args) + 2 * sizeof(uint64_t)));
    prog.push_back(jump(BPF_JMP | BPF_JSET | BPF_K, PROT_EXEC, 0, 1));
    prog.push_back(stmt(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    prog.push_back(stmt(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));

    // Accumulator still holds nr on this path. Jump targets to the final
    // ALLOW are patched once its index is known.
    std::vector<size_t> to_allow;
    for (long nr : allow) {
        to_allow.push_back(prog.size());
        prog.push_back(jump(BPF_JMP | BPF_JEQ | BPF_K, (uint32_t)nr, 0, 0));
    }
#ifdef SYS_clone3
    prog.push_back(jump(BPF_JMP | BPF_JEQ | BPF_K, SYS_clone3, 0, 1));
    prog.push_back(stmt(BPF_RET | BPF_K, SECCOMP_RET_ERRNO | (ENOSYS & SECCOMP_RET_DATA)));
#endif
    prog.push_back(stmt(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    const size_t allow_at = prog.size();
    prog.push_back(stmt(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));

    for (size_t at : to_allow) {
        size_t off = allow_at - at - 1;
        if (off > 255) return "seccomp: allowlist too long for a single jump";
        prog[at].jt = (uint8_t)off;
    }

    sock_fprog fprog{};
    fprog.len = (unsigned short)prog.size();
    fprog.filter = prog.data();
    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &fprog, 0, 0) != 0) {
        return std::string("seccomp install failed: ") + std::strerror(errno);
    }
    return "";
#endif
}

bool seccomp_available() {
    // 0: available and not active, 2: filter mode already active.
    return prctl(PR_GET_SECCOMP, 0, 0, 0, 0) >= 0;
}

} // namespace scrapeguard

#else // !__linux__

namespace scrapeguard {

std::string install_seccomp_filter(SeccompProfile) {
    return "";
}

bool seccomp_available() {
    return false;
}

} // namespace scrapeguard

#endif
