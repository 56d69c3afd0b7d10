#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <cstdint>
#include <string>

struct Flags {
  // Logging
  static std::string log_file;
  static bool verbose;

  // Identity of the sandboxed child, -1 keeps the current one.
  static int32_t uid;
  static int32_t gid;

  // Keep ./main even when the compilation fails.
  static bool keep_artifact;
};

#endif
