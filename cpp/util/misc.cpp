#include "util/misc.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>

namespace util {

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

bool parseInt64(const std::string& s, int64_t* value) {
  if (s.empty()) return false;
  char* end = nullptr;
  errno = 0;
  long long parsed = strtoll(s.c_str(), &end, 10);  // NOLINT
  if (errno == ERANGE || end == s.c_str() || *end != '\0') return false;
  *value = parsed;
  return true;
}

std::function<bool()> setBool(bool& var) {
  return [&var]() {
    var = true;
    return true;
  };
};

std::function<bool(kj::StringPtr)> setString(std::string& var) {
  return [&var](kj::StringPtr p) {
    var = p;
    return true;
  };
};

std::function<bool(kj::StringPtr)> setInt(int& var) {
  return [&var](kj::StringPtr p) {
    int64_t value = 0;
    if (!parseInt64(p.cStr(), &value)) return false;
    if (value < INT_MIN || value > INT_MAX) return false;
    var = static_cast<int>(value);
    return true;
  };
};

}  // namespace util
