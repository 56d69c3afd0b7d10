#include "engine/verdict.hpp"

#include <csignal>
#include <cstring>

#include <kj/debug.h>

namespace engine {

namespace {
#define SIGNAL(name) \
  { name, #name }
const struct {
  int signal;
  const char* name;
} kSignalNames[] = {
    SIGNAL(SIGHUP),  SIGNAL(SIGINT),    SIGNAL(SIGQUIT), SIGNAL(SIGILL),
    SIGNAL(SIGTRAP), SIGNAL(SIGABRT),   SIGNAL(SIGBUS),  SIGNAL(SIGFPE),
    SIGNAL(SIGKILL), SIGNAL(SIGUSR1),   SIGNAL(SIGSEGV), SIGNAL(SIGUSR2),
    SIGNAL(SIGPIPE), SIGNAL(SIGALRM),   SIGNAL(SIGTERM), SIGNAL(SIGCHLD),
    SIGNAL(SIGCONT), SIGNAL(SIGSTOP),   SIGNAL(SIGTSTP), SIGNAL(SIGTTIN),
    SIGNAL(SIGTTOU), SIGNAL(SIGURG),    SIGNAL(SIGXCPU), SIGNAL(SIGXFSZ),
    SIGNAL(SIGVTALRM), SIGNAL(SIGPROF), SIGNAL(SIGWINCH), SIGNAL(SIGIO),
    SIGNAL(SIGSYS),
};
#undef SIGNAL

std::string SignalMessage(int signal) {
  const char* description = strsignal(signal);
  return "WIFSIGNALED WTERMSIG=" + std::to_string(signal) + " (" +
         (description != nullptr ? description : "unknown signal") + ")";
}

std::string KillMessage(const ExecutionRequest& request,
                        const sandbox::ExecutionInfo& info) {
  switch (info.kill_reason) {
    case sandbox::KillReason::kNone:
      return "";
    case sandbox::KillReason::kWallTime:
      return "; wall time " + std::to_string(info.wall_time_millis) +
             " ms exceeded " + std::to_string(request.time_limit_millis) +
             " ms";
    case sandbox::KillReason::kMemory:
      return "; resident memory exceeded " +
             std::to_string(request.memory_limit_kb) + " KB";
    case sandbox::KillReason::kThreads:
      return "; threads exceeded " + std::to_string(request.process_limit);
  }
  KJ_UNREACHABLE;
}
}  // namespace

std::string SignalName(int signal) {
  for (const auto& entry : kSignalNames) {
    if (entry.signal == signal) return entry.name;
  }
  return "SIG" + std::to_string(signal);
}

std::string StatusString(const Verdict& verdict) {
  switch (verdict.status) {
    case Status::kExited:
      return "Exited Normally";
    case Status::kSignaled:
      return "Runtime Error (" + SignalName(verdict.signal) + ")";
    case Status::kTimedOut:
      return "Time Limit Exceeded";
    case Status::kMemoryExceeded:
      return "Memory Limit Exceeded";
    case Status::kProcessExceeded:
      return "Process Limit Exceeded";
    case Status::kOutputExceeded:
      return "Output Limit Exceeded";
    case Status::kRestricted:
      return "Restricted Function";
    case Status::kSetupFailed:
      return "Sandbox Setup Failed";
  }
  KJ_UNREACHABLE;
}

Verdict ResolveVerdict(const ExecutionRequest& request, bool started,
                       const std::string& error_msg,
                       const sandbox::ExecutionInfo& info) {
  Verdict verdict;
  if (!started) {
    verdict.status = Status::kSetupFailed;
    verdict.exit_msg = error_msg;
    return verdict;
  }
  verdict.duration_millis = info.wall_time_millis;
  verdict.memory_kb = info.memory_usage_kb;
  verdict.exit_code = info.status_code;
  verdict.signal = info.signal;
  if (info.signal != 0) {
    verdict.exit_msg = SignalMessage(info.signal);
  } else {
    verdict.exit_msg =
        "WIFEXITED WEXITSTATUS=" + std::to_string(info.status_code);
  }
  verdict.exit_msg += KillMessage(request, info);

  // RLIMIT_CPU sends SIGXCPU at the soft limit and SIGKILL at the hard one.
  int64_t cpu_millis = info.cpu_time_millis + info.sys_time_millis;
  bool cpu_exceeded =
      info.signal == SIGXCPU ||
      (info.signal == SIGKILL && cpu_millis >= request.time_limit_millis);
  if (info.kill_reason == sandbox::KillReason::kWallTime || cpu_exceeded) {
    verdict.status = Status::kTimedOut;
  } else if (info.kill_reason == sandbox::KillReason::kMemory ||
             info.memory_usage_kb > request.memory_limit_kb) {
    verdict.status = Status::kMemoryExceeded;
  } else if (info.kill_reason == sandbox::KillReason::kThreads) {
    verdict.status = Status::kProcessExceeded;
  } else if (info.signal == SIGXFSZ || info.output_limit_reached) {
    verdict.status = Status::kOutputExceeded;
  } else if (info.signal == SIGSYS) {
    verdict.status = Status::kRestricted;
  } else if (info.signal != 0) {
    verdict.status = Status::kSignaled;
  } else {
    verdict.status = Status::kExited;
  }
  return verdict;
}

}  // namespace engine
