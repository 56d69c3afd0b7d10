#ifndef ENGINE_ENGINE_HPP
#define ENGINE_ENGINE_HPP

#include <string>
#include <utility>
#include "engine/request.hpp"
#include "engine/verdict.hpp"
#include "sandbox/sandbox.hpp"

namespace engine {

// Executes a single request inside the sandbox. root is the working
// directory shared by the compile and the run invocations.
class Engine {
 public:
  explicit Engine(ExecutionRequest request, std::string root = ".")
      : request_(std::move(request)), root_(std::move(root)) {}

  // Runs the request, writes the result file and returns the verdict. Throws
  // std::system_error if the result file cannot be written.
  Verdict Run();

  // Sandbox settings for the request. Returns false and sets error_msg if the
  // program to execute cannot be determined.
  bool BuildOptions(sandbox::ExecutionOptions* options,
                    std::string* error_msg) const;

 private:
  Verdict Execute();

  ExecutionRequest request_;
  std::string root_;
};

}  // namespace engine

#endif
