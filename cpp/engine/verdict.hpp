#ifndef ENGINE_VERDICT_HPP
#define ENGINE_VERDICT_HPP

#include <cstdint>
#include <string>
#include "engine/request.hpp"
#include "sandbox/sandbox.hpp"

namespace engine {

// Terminal states of an execution.
enum class Status {
  kExited,
  kSignaled,
  kTimedOut,
  kMemoryExceeded,
  kProcessExceeded,
  kOutputExceeded,
  kRestricted,
  kSetupFailed
};

// Outcome of one execution, as written to the result file.
struct Verdict {
  Status status = Status::kSetupFailed;
  std::string exit_msg;
  int64_t duration_millis = 0;
  int64_t memory_kb = 0;
  // Only meaningful for kExited.
  int32_t exit_code = 0;
  // Only meaningful when the program was killed by a signal.
  int32_t signal = 0;
};

// Short name of a signal, like "SIGSEGV". Unknown signals are rendered as
// "SIG" followed by the number.
std::string SignalName(int signal);

// The first line of the result file for the verdict.
std::string StatusString(const Verdict& verdict);

// Classifies the outcome of Sandbox::Execute. started is its return value,
// error_msg and info what it filled in.
Verdict ResolveVerdict(const ExecutionRequest& request, bool started,
                       const std::string& error_msg,
                       const sandbox::ExecutionInfo& info);

}  // namespace engine

#endif
