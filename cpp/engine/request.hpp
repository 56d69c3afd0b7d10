#ifndef ENGINE_REQUEST_HPP
#define ENGINE_REQUEST_HPP

#include <cstdint>
#include <string>
#include "sandbox/seccomp_policy.hpp"

namespace engine {

// Languages the engine knows how to compile and run. The numeric values are
// the identifiers accepted on the command line.
enum class Language { kC = 0, kCpp = 1 };

// One compile or run attempt, as requested on the command line.
struct ExecutionRequest {
  Language language = Language::kC;
  sandbox::Phase phase = sandbox::Phase::kRun;
  std::string stdin_path;
  std::string stdout_path;
  std::string stderr_path;
  int64_t time_limit_millis = 0;
  int64_t memory_limit_kb = 0;
  bool large_stack = false;
  int64_t output_limit_bytes = 0;
  int64_t process_limit = 0;
  std::string result_path;

  // Checks the invariants that single fields cannot check on their own:
  // every limit set, every path given, destinations writable. Returns false
  // and sets error_msg if the request cannot be executed.
  bool Validate(std::string* error_msg) const;
};

// Parsers for the positional arguments. Each returns false and sets
// error_msg if arg is not acceptable.
bool ParseLanguage(const std::string& arg, Language* language,
                   std::string* error_msg);
bool ParsePhase(const std::string& arg, sandbox::Phase* phase,
                std::string* error_msg);
bool ParseSwitch(const std::string& arg, const char* what, bool* value,
                 std::string* error_msg);
bool ParseLimit(const std::string& arg, const char* what, int64_t* value,
                std::string* error_msg);
bool ParsePath(const std::string& arg, const char* what, std::string* path,
               std::string* error_msg);

}  // namespace engine

#endif
