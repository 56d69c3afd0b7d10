#ifndef SANDBOX_SECCOMP_POLICY_HPP
#define SANDBOX_SECCOMP_POLICY_HPP

#include <cstddef>

#include <kj/common.h>

namespace sandbox {

// What the sandboxed child is doing. The compiler driver needs to spawn
// helper processes and create files, the compiled program does not.
enum class Phase { kCompile, kRun };

const char* PhaseName(Phase phase);

// A single allowlist entry. Check restricts the arguments the syscall may be
// called with; calls that do not satisfy the check are treated as calls
// outside the allowlist.
struct SyscallRule {
  enum class Check {
    kAlways,            // Any arguments.
    kReadOnlyOpen,      // open/openat with no flag that can modify a file:
                        // O_WRONLY, O_RDWR, O_CREAT, O_TRUNC, O_APPEND or
                        // O_TMPFILE.
    kThreadClone,       // clone must create a thread (CLONE_THREAD).
    kNoNamespaceClone,  // clone must not create new namespaces.
    kNoSys,             // Fails with ENOSYS instead of killing the process.
    kQueryLimits,       // prlimit64 can only read limits.
    kTerminalQuery,     // ioctl can only be TCGETS (isatty).
    kOwnProcess,        // kill/tgkill can only target the child itself.
    kTargetExecutable,  // execve only of the executable set by the sandbox.
  };
  const char* name;
  Check check;
};

// Per-phase syscall allowlists. Any syscall not listed, or listed but called
// with arguments its Check rejects, kills the whole process with SIGSYS.
// Syscalls that do not exist on the running architecture are skipped.
class SyscallPolicy {
 public:
  // The authoritative allowlist for the phase.
  static kj::ArrayPtr<const SyscallRule> Rules(Phase phase);

  // Returns the rule for the given syscall name, or nullptr if the syscall is
  // not in the allowlist of the phase.
  static const SyscallRule* Find(Phase phase, const char* name);

  // Returns true if the syscall can succeed in the given phase, possibly
  // subject to argument checks.
  static bool IsAllowed(Phase phase, const char* name);

  // Builds the filter for the phase and loads it into the calling process.
  // executable must be the very pointer that will be passed to execve.
  // Returns false and writes a message of at most buflen bytes to error_msg
  // on failure. Meant to be called in a freshly forked child: it does not
  // allocate the error message.
  static bool Install(Phase phase, const char* executable, char* error_msg,
                      size_t buflen);
};

}  // namespace sandbox

#endif
