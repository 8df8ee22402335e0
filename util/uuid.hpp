#ifndef UTIL_UUID_HPP
#define UTIL_UUID_HPP

#include <string>

namespace util {

// Returns a random (version 4) UUID in its canonical lowercase form.
std::string NewUUID();

}  // namespace util

#endif
