#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which: returns the full path of the
// first executable file named cmd in one of the directories listed in PATH,
// or an empty string. Throws if PATH is not set.
// Successful lookups are cached, unless use_cache is false. A cached path is
// returned even if the file was removed in the meantime.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
