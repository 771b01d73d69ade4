#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which. Uses caching to speed up
// lookups, unless explicitly disabled. Returns an empty string if the command
// cannot be found, and throws if PATH is not set.
// Once a command is found it stays in the cache even if the file is removed.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
