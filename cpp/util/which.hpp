#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which. Uses caching to speed up
// lookups, unless explicitly disabled. Returns an empty string if the command
// cannot be found, throws if PATH is not set.
// Once a command is found it's put in the cache, and later requests for it
// are served from the cache even if the file is no longer there.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
