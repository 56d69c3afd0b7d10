#include "engine/request.hpp"

#include "util/file.hpp"
#include "util/misc.hpp"

namespace engine {

bool ParseLanguage(const std::string& arg, Language* language,
                   std::string* error_msg) {
  int64_t id = 0;
  if (util::parseInt64(arg, &id)) {
    switch (id) {
      case static_cast<int64_t>(Language::kC):
        *language = Language::kC;
        return true;
      case static_cast<int64_t>(Language::kCpp):
        *language = Language::kCpp;
        return true;
      default:
        break;
    }
  }
  *error_msg = "unknown language id: " + arg;
  return false;
}

bool ParsePhase(const std::string& arg, sandbox::Phase* phase,
                std::string* error_msg) {
  bool compile = false;
  if (!ParseSwitch(arg, "compile flag", &compile, error_msg)) return false;
  *phase = compile ? sandbox::Phase::kCompile : sandbox::Phase::kRun;
  return true;
}

bool ParseSwitch(const std::string& arg, const char* what, bool* value,
                 std::string* error_msg) {
  if (arg == "0" || arg == "1") {
    *value = arg == "1";
    return true;
  }
  *error_msg = std::string(what) + " must be 0 or 1, got \"" + arg + "\"";
  return false;
}

bool ParseLimit(const std::string& arg, const char* what, int64_t* value,
                std::string* error_msg) {
  int64_t parsed = 0;
  if (!util::parseInt64(arg, &parsed)) {
    *error_msg = std::string(what) + " is not a number: \"" + arg + "\"";
    return false;
  }
  if (parsed <= 0) {
    *error_msg = std::string(what) + " must be positive, got " + arg;
    return false;
  }
  *value = parsed;
  return true;
}

bool ParsePath(const std::string& arg, const char* what, std::string* path,
               std::string* error_msg) {
  if (arg.empty()) {
    *error_msg = std::string(what) + " must not be empty";
    return false;
  }
  *path = arg;
  return true;
}

bool ExecutionRequest::Validate(std::string* error_msg) const {
  struct {
    const char* what;
    int64_t value;
  } limits[] = {
      {"time limit", time_limit_millis},
      {"memory limit", memory_limit_kb},
      {"output limit", output_limit_bytes},
      {"process limit", process_limit},
  };
  for (const auto& limit : limits) {
    if (limit.value <= 0) {
      *error_msg = std::string(limit.what) + " must be positive";
      return false;
    }
  }
  // RLIMIT_AS is set to twice the memory limit, in bytes.
  if (memory_limit_kb > INT64_MAX / 2048) {
    *error_msg = "memory limit is too large";
    return false;
  }
  if (process_limit > INT32_MAX) {
    *error_msg = "process limit is too large";
    return false;
  }

  struct {
    const char* what;
    const std::string& path;
    bool written;
  } paths[] = {
      {"stdin path", stdin_path, false},
      {"stdout path", stdout_path, true},
      {"stderr path", stderr_path, true},
      {"result path", result_path, true},
  };
  for (const auto& path : paths) {
    if (path.path.empty()) {
      *error_msg = std::string(path.what) + " must not be empty";
      return false;
    }
    if (path.written && !util::File::CanCreateIn(path.path)) {
      *error_msg =
          std::string(path.what) + " is not writable: \"" + path.path + "\"";
      return false;
    }
  }
  return true;
}

}  // namespace engine
