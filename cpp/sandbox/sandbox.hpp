#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "sandbox/seccomp_policy.hpp"
#include "util/file.hpp"

namespace sandbox {

// Settings to execute the program in the sandbox. Limits set to 0 are not
// applied.
struct ExecutionOptions {
  int64_t cpu_limit_millis = 0;
  int64_t wall_limit_millis = 0;
  // Address space limit (RLIMIT_AS).
  int64_t memory_limit_kb = 0;
  // Resident memory above which the watchdog kills the child.
  int64_t resident_limit_kb = 0;
  int32_t max_procs = 0;
  // Threads of the child above which the watchdog kills it. RLIMIT_NPROC
  // does not bind root.
  int32_t max_threads = 0;
  int32_t max_files = 0;
  int64_t max_file_size_bytes = 0;
  int64_t max_mlock_kb = 0;
  int64_t max_stack_kb = 0;

  // Credentials of the child, -1 keeps the ones of the supervisor.
  int32_t uid = -1;
  int32_t gid = -1;

  // Syscall allowlist to install before exec, if any.
  bool restrict_syscalls = false;
  Phase phase = Phase::kRun;

  // Empty paths leave the corresponding stream untouched.
  std::string stdin_file;
  std::string stdout_file;
  std::string stderr_file;
  // Arguments after argv[0], which is always the executable.
  std::vector<std::string> args;

  // Required values
  std::string root;
  std::string executable;
  bool prepare_executable = false;
  ExecutionOptions(std::string root_, std::string executable_)
      : root(std::move(root_)), executable(std::move(executable_)) {}
  void SetArgs(const std::vector<std::string>& a_) { args = a_; }
  void SetArgs(const std::initializer_list<const char*>& a_) {
    args.assign(a_.begin(), a_.end());
  }
};

// Why the supervisor killed the child, if it did.
enum class KillReason { kNone, kWallTime, kMemory, kThreads };

// Results of the execution.
struct ExecutionInfo {
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  int64_t memory_usage_kb = 0;
  int32_t status_code = 0;
  int32_t signal = 0;
  KillReason kill_reason = KillReason::kNone;
  // Some output file went over max_file_size_bytes and was cut back to it,
  // even if the program survived SIGXFSZ.
  bool output_limit_reached = false;
  std::string message;
};

// Sandbox interface. Create returns the implementation for the current
// platform.
class Sandbox {
 public:
  static std::unique_ptr<Sandbox> Create();

  // Runs the specified command. Returns true if the program was started,
  // and sets fields in info. Otherwise, returns false and sets error_msg.
  // Implementations of this function may not be thread safe.
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) {
    if (options.prepare_executable) {
      if (!PrepareForExecution(
              util::File::JoinPath(options.root, options.executable),
              error_msg)) {
        return false;
      }
    }
    return ExecuteInternal(options, info, error_msg);
  }

  // Constructor and destructors
  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;

 protected:
  virtual bool ExecuteInternal(const ExecutionOptions& options,
                               ExecutionInfo* info, std::string* error_msg) = 0;

  // Prepares a newly-created file for execution. Returns false on error,
  // and sets error_msg.
  virtual bool PrepareForExecution(const std::string& /*executable*/,
                                   std::string* /*error_msg*/) {
    return true;
  }
};

}  // namespace sandbox

#endif
