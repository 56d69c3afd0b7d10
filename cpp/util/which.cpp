#include "util/which.hpp"
#include <cstdlib>
#include <string>
#include <unordered_map>
#include <vector>

#include <kj/debug.h>
#include "util/file.hpp"
#include "util/misc.hpp"

namespace {
std::unordered_map<std::string, std::string> cmd_cache;
}  // namespace

namespace util {

std::string which(const std::string& cmd, bool use_cache) {
  if (use_cache && cmd_cache.count(cmd) > 0) return cmd_cache[cmd];

  const char* path = std::getenv("PATH");
  KJ_REQUIRE(path != nullptr, "PATH is not set", cmd.c_str());

  for (const std::string& dir : split(path, ':')) {
    std::string fullpath = util::File::JoinPath(dir, cmd);
    if (File::Exists(fullpath)) return cmd_cache[cmd] = fullpath;
  }
  return "";
}

}  // namespace util
