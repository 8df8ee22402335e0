#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which: returns the first executable
// file named cmd in the directories of PATH, or an empty string. A cmd
// containing a slash is returned unchanged if it is executable.
// Found commands are cached, unless caching is explicitly disabled. Throws if
// PATH is not set.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
