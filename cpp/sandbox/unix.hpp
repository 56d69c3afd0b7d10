#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP
#include <sys/types.h>
#include <string>
#include <vector>
#include "sandbox/sandbox.hpp"

namespace sandbox {

// Sandbox for Linux based on fork, resource limits and a seccomp filter. The
// child becomes the leader of a new process group, so that the whole tree
// can be killed at once.
class Unix : public Sandbox {
 public:
  Unix() = default;

 protected:
  bool PrepareForExecution(const std::string& executable,
                           std::string* error_msg) override;
  bool ExecuteInternal(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) override;

  // Executed before creating the child process. Prepares everything the
  // child needs, so that it does not have to allocate memory. Returns false
  // and sets error_msg if setup fails.
  bool Setup(std::string* error_msg);

  // Creates a child process and saves its PID in child_pid_. The child process
  // executes Child and never returns.
  bool DoFork(std::string* error_msg);

  // Function that is executed in the child process. Every confinement step
  // happens here, in order, before exec.
  [[noreturn]] void Child();

  // Hook that is executed just before exec. Returns false if something went
  // wrong and exec should not be called. The error_msg string must not be
  // longer then buflen characters. This function must not use dynamic memory
  // allocation.
  virtual bool OnChild(char* error_msg, size_t buflen);

  // Waits for the termination of the child, killing its process group if it
  // exceeds the wall time limit, the resident memory limit or the thread
  // limit. Also records whether an output file reached its size limit.
  bool Wait(ExecutionInfo* info, std::string* error_msg);

  // Sends SIGKILL to the process group of the child.
  void KillProcessGroup();

  int pipe_fds_[2] = {-1, -1};
  pid_t child_pid_ = 0;
  const ExecutionOptions* options_ = nullptr;
  std::vector<std::string> argv_storage_;
  std::vector<char*> argv_;
};

}  // namespace sandbox
#endif
