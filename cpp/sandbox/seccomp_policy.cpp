#include "sandbox/seccomp_policy.hpp"

#include <fcntl.h>
#include <sched.h>
#include <seccomp.h>
#include <sys/ioctl.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>

#include <kj/common.h>

namespace sandbox {

namespace {

using Check = SyscallRule::Check;

// Compiled programs: stdio on the inherited descriptors, read-only file
// access for the dynamic loader, threads and their synchronization, time and
// randomness.
const SyscallRule kRunRules[] = {
    {"read", Check::kAlways},
    {"readv", Check::kAlways},
    {"pread64", Check::kAlways},
    {"write", Check::kAlways},
    {"writev", Check::kAlways},
    {"open", Check::kReadOnlyOpen},
    {"openat", Check::kReadOnlyOpen},
    {"close", Check::kAlways},
    {"fstat", Check::kAlways},
    {"stat", Check::kAlways},
    {"lstat", Check::kAlways},
    {"newfstatat", Check::kAlways},
    {"statx", Check::kAlways},
    {"lseek", Check::kAlways},
    {"fcntl", Check::kAlways},
    {"access", Check::kAlways},
    {"faccessat", Check::kAlways},
    {"faccessat2", Check::kAlways},
    {"readlink", Check::kAlways},
    {"readlinkat", Check::kAlways},
    {"getcwd", Check::kAlways},
    {"ioctl", Check::kTerminalQuery},

    {"brk", Check::kAlways},
    {"mmap", Check::kAlways},
    {"mprotect", Check::kAlways},
    {"munmap", Check::kAlways},
    {"mremap", Check::kAlways},
    {"madvise", Check::kAlways},

    {"execve", Check::kTargetExecutable},
    {"arch_prctl", Check::kAlways},
    {"set_tid_address", Check::kAlways},
    {"set_robust_list", Check::kAlways},
    {"rseq", Check::kAlways},
    {"uname", Check::kAlways},
    {"sysinfo", Check::kAlways},
    {"prlimit64", Check::kQueryLimits},
    {"getrlimit", Check::kAlways},
    {"getrandom", Check::kAlways},

    {"futex", Check::kAlways},
    {"clone", Check::kThreadClone},
    {"clone3", Check::kNoSys},
    {"sched_yield", Check::kAlways},
    {"sched_getaffinity", Check::kAlways},
    {"getpid", Check::kAlways},
    {"gettid", Check::kAlways},
    {"getuid", Check::kAlways},
    {"geteuid", Check::kAlways},
    {"getgid", Check::kAlways},
    {"getegid", Check::kAlways},

    {"rt_sigaction", Check::kAlways},
    {"rt_sigprocmask", Check::kAlways},
    {"rt_sigreturn", Check::kAlways},
    {"sigaltstack", Check::kAlways},
    {"kill", Check::kOwnProcess},
    {"tgkill", Check::kOwnProcess},

    {"clock_gettime", Check::kAlways},
    {"clock_getres", Check::kAlways},
    {"gettimeofday", Check::kAlways},
    {"time", Check::kAlways},
    {"times", Check::kAlways},
    {"getrusage", Check::kAlways},
    {"nanosleep", Check::kAlways},
    {"clock_nanosleep", Check::kAlways},
    {"restart_syscall", Check::kAlways},

    {"exit", Check::kAlways},
    {"exit_group", Check::kAlways},
};

// The compiler driver spawns cc1, as, collect2 and ld, talks to them through
// pipes and temporary files, and writes the artifact.
const SyscallRule kCompileRules[] = {
    {"read", Check::kAlways},
    {"readv", Check::kAlways},
    {"pread64", Check::kAlways},
    {"write", Check::kAlways},
    {"writev", Check::kAlways},
    {"pwrite64", Check::kAlways},
    {"open", Check::kAlways},
    {"openat", Check::kAlways},
    {"creat", Check::kAlways},
    {"close", Check::kAlways},
    {"close_range", Check::kAlways},
    {"fstat", Check::kAlways},
    {"stat", Check::kAlways},
    {"lstat", Check::kAlways},
    {"newfstatat", Check::kAlways},
    {"statx", Check::kAlways},
    {"statfs", Check::kAlways},
    {"fstatfs", Check::kAlways},
    {"lseek", Check::kAlways},
    {"fcntl", Check::kAlways},
    {"access", Check::kAlways},
    {"faccessat", Check::kAlways},
    {"faccessat2", Check::kAlways},
    {"readlink", Check::kAlways},
    {"readlinkat", Check::kAlways},
    {"getcwd", Check::kAlways},
    {"chdir", Check::kAlways},
    {"fchdir", Check::kAlways},
    {"getdents", Check::kAlways},
    {"getdents64", Check::kAlways},
    {"ioctl", Check::kTerminalQuery},
    {"dup", Check::kAlways},
    {"dup2", Check::kAlways},
    {"dup3", Check::kAlways},
    {"pipe", Check::kAlways},
    {"pipe2", Check::kAlways},
    {"poll", Check::kAlways},
    {"ppoll", Check::kAlways},
    {"select", Check::kAlways},
    {"pselect6", Check::kAlways},

    {"unlink", Check::kAlways},
    {"unlinkat", Check::kAlways},
    {"rename", Check::kAlways},
    {"renameat", Check::kAlways},
    {"renameat2", Check::kAlways},
    {"mkdir", Check::kAlways},
    {"mkdirat", Check::kAlways},
    {"rmdir", Check::kAlways},
    {"chmod", Check::kAlways},
    {"fchmod", Check::kAlways},
    {"fchmodat", Check::kAlways},
    {"umask", Check::kAlways},
    {"ftruncate", Check::kAlways},
    {"fallocate", Check::kAlways},
    {"fadvise64", Check::kAlways},
    {"fsync", Check::kAlways},
    {"fdatasync", Check::kAlways},
    {"utimensat", Check::kAlways},

    {"brk", Check::kAlways},
    {"mmap", Check::kAlways},
    {"mprotect", Check::kAlways},
    {"munmap", Check::kAlways},
    {"mremap", Check::kAlways},
    {"madvise", Check::kAlways},

    {"execve", Check::kAlways},
    {"fork", Check::kAlways},
    {"vfork", Check::kAlways},
    {"clone", Check::kNoNamespaceClone},
    {"clone3", Check::kNoSys},
    {"wait4", Check::kAlways},
    {"waitid", Check::kAlways},
    {"arch_prctl", Check::kAlways},
    {"set_tid_address", Check::kAlways},
    {"set_robust_list", Check::kAlways},
    {"rseq", Check::kAlways},
    {"uname", Check::kAlways},
    {"sysinfo", Check::kAlways},
    {"prlimit64", Check::kAlways},
    {"getrlimit", Check::kAlways},
    {"setrlimit", Check::kAlways},
    {"getrandom", Check::kAlways},

    {"futex", Check::kAlways},
    {"sched_yield", Check::kAlways},
    {"sched_getaffinity", Check::kAlways},
    {"getpid", Check::kAlways},
    {"getppid", Check::kAlways},
    {"gettid", Check::kAlways},
    {"getpgrp", Check::kAlways},
    {"getuid", Check::kAlways},
    {"geteuid", Check::kAlways},
    {"getgid", Check::kAlways},
    {"getegid", Check::kAlways},
    {"getgroups", Check::kAlways},

    {"rt_sigaction", Check::kAlways},
    {"rt_sigprocmask", Check::kAlways},
    {"rt_sigreturn", Check::kAlways},
    {"sigaltstack", Check::kAlways},
    {"kill", Check::kOwnProcess},
    {"tgkill", Check::kOwnProcess},

    {"clock_gettime", Check::kAlways},
    {"clock_getres", Check::kAlways},
    {"gettimeofday", Check::kAlways},
    {"time", Check::kAlways},
    {"times", Check::kAlways},
    {"getrusage", Check::kAlways},
    {"nanosleep", Check::kAlways},
    {"clock_nanosleep", Check::kAlways},
    {"restart_syscall", Check::kAlways},

    {"exit", Check::kAlways},
    {"exit_group", Check::kAlways},
};

// Any of these bits lets open modify a file: O_TRUNC empties it even when it
// is opened read-only. O_TMPFILE contains O_DIRECTORY, only its own bit is
// checked.
const constexpr scmp_datum_t kWriteOpenFlags = O_WRONLY | O_RDWR | O_CREAT |
                                                O_TRUNC | O_APPEND |
                                                (O_TMPFILE & ~O_DIRECTORY);
const constexpr scmp_datum_t kNamespaceFlags =
    CLONE_NEWNS | CLONE_NEWUSER | CLONE_NEWPID | CLONE_NEWNET | CLONE_NEWIPC |
    CLONE_NEWUTS | CLONE_NEWCGROUP;

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"  // SCMP_* macros
// Returns 0 or a negative errno, as libseccomp does.
int AddRule(scmp_filter_ctx ctx, int nr, Check check, const char* executable,
            pid_t self) {
  switch (check) {
    case Check::kAlways:
      return seccomp_rule_add(ctx, SCMP_ACT_ALLOW, nr, 0);
    case Check::kReadOnlyOpen: {
      // open(path, flags), openat(dirfd, path, flags)
      unsigned flags_arg = nr == SCMP_SYS(openat) ? 2 : 1;
      return seccomp_rule_add(
          ctx, SCMP_ACT_ALLOW, nr, 1,
          SCMP_CMP(flags_arg, SCMP_CMP_MASKED_EQ, kWriteOpenFlags, 0));
    }
    case Check::kThreadClone:
      return seccomp_rule_add(
          ctx, SCMP_ACT_ALLOW, nr, 1,
          SCMP_A0(SCMP_CMP_MASKED_EQ, CLONE_THREAD, CLONE_THREAD));
    case Check::kNoNamespaceClone:
      return seccomp_rule_add(
          ctx, SCMP_ACT_ALLOW, nr, 1,
          SCMP_A0(SCMP_CMP_MASKED_EQ, kNamespaceFlags, 0));
    case Check::kNoSys:
      return seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), nr, 0);
    case Check::kQueryLimits:
      // prlimit64(pid, resource, new_limit, old_limit)
      return seccomp_rule_add(ctx, SCMP_ACT_ALLOW, nr, 1,
                              SCMP_A2(SCMP_CMP_EQ, 0));
    case Check::kTerminalQuery:
      return seccomp_rule_add(ctx, SCMP_ACT_ALLOW, nr, 1,
                              SCMP_A1(SCMP_CMP_EQ, TCGETS));
    case Check::kOwnProcess:
      return seccomp_rule_add(ctx, SCMP_ACT_ALLOW, nr, 1,
                              SCMP_A0(SCMP_CMP_EQ, (scmp_datum_t)self));
    case Check::kTargetExecutable:
      if (executable == nullptr) return 0;
      return seccomp_rule_add(
          ctx, SCMP_ACT_ALLOW, nr, 1,
          SCMP_A0(SCMP_CMP_EQ, (scmp_datum_t)executable));  // NOLINT
  }
  return -EINVAL;
}
#pragma GCC diagnostic pop

}  // namespace

const char* PhaseName(Phase phase) {
  switch (phase) {
    case Phase::kCompile:
      return "compile";
    case Phase::kRun:
      return "run";
  }
  return "unknown";
}

kj::ArrayPtr<const SyscallRule> SyscallPolicy::Rules(Phase phase) {
  switch (phase) {
    case Phase::kCompile:
      return kj::arrayPtr(kCompileRules, kj::size(kCompileRules));
    case Phase::kRun:
      return kj::arrayPtr(kRunRules, kj::size(kRunRules));
  }
  return nullptr;
}

const SyscallRule* SyscallPolicy::Find(Phase phase, const char* name) {
  for (const SyscallRule& rule : Rules(phase)) {
    if (strcmp(rule.name, name) == 0) return &rule;
  }
  return nullptr;
}

bool SyscallPolicy::IsAllowed(Phase phase, const char* name) {
  const SyscallRule* rule = Find(phase, name);
  return rule != nullptr && rule->check != Check::kNoSys;
}

bool SyscallPolicy::Install(Phase phase, const char* executable,
                            char* error_msg, size_t buflen) {
  scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_KILL_PROCESS);
  if (ctx == nullptr) {
    snprintf(error_msg, buflen, "seccomp_init failed");  // NOLINT
    return false;
  }
  KJ_DEFER(seccomp_release(ctx));

#define CHECK_SECCOMP(call)                                            \
  do {                                                                 \
    if (int result = (call)) {                                         \
      snprintf(error_msg, buflen, "%s: %s", #call, strerror(-result)); \
      return false;                                                    \
    }                                                                  \
  } while (0)

  CHECK_SECCOMP(seccomp_attr_set(ctx, SCMP_FLTATR_CTL_NNP, 1));
  // x32 and i386 entry points would bypass the native syscall numbers.
  CHECK_SECCOMP(
      seccomp_attr_set(ctx, SCMP_FLTATR_ACT_BADARCH, SCMP_ACT_KILL_PROCESS));

  pid_t self = getpid();
  for (const SyscallRule& rule : Rules(phase)) {
    int nr = seccomp_syscall_resolve_name(rule.name);
    if (nr == __NR_SCMP_ERROR) continue;
    int result = AddRule(ctx, nr, rule.check, executable, self);
    if (result != 0) {
      snprintf(error_msg, buflen, "seccomp_rule_add %s: %s",  // NOLINT
               rule.name, strerror(-result));
      return false;
    }
  }

  CHECK_SECCOMP(seccomp_load(ctx));
#undef CHECK_SECCOMP
  return true;
}

}  // namespace sandbox
