#pragma once

// Scrapeguard sandbox: seccomp-BPF syscall allowlist for worker processes.
//
// Allowlist only. A syscall that is not listed kills the process (SIGSYS),
// except clone3, which fails with ENOSYS so libc falls back to clone.
// Opt-in via ProcLimits.enable_seccomp or SCRAPEGUARD_SECCOMP_ENABLE=1.
//
// Profiles:
//   STRICT  I/O on existing descriptors, memory, signals, time, exec.
//           No socket syscalls.
//   NET     STRICT plus outbound socket syscalls, for a worker whose
//           fetch helpers launch curl.
//
// mprotect with PROT_EXEC is always refused.

#include <string>

namespace scrapeguard {

enum class SeccompProfile { STRICT, NET };

const char* seccomp_profile_name(SeccompProfile p);

// "net" selects NET; anything else is STRICT.
SeccompProfile seccomp_profile_from_string(const std::string& s);

// Install the filter on the calling thread. Call AFTER
// prctl(PR_SET_NO_NEW_PRIVS, 1). Returns empty string on success, an error
// message otherwise. No-op success on non-Linux.
std::string install_seccomp_filter(SeccompProfile profile = SeccompProfile::STRICT);

bool seccomp_available();

} // namespace scrapeguard
