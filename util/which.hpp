#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which. Uses caching to speed up
// lookups, unless explicitly disabled. A found command stays in the cache even
// if the file is later removed. Commands containing a slash are returned
// unchanged if they exist. Throws if PATH is not set.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
