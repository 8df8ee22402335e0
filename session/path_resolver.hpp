#ifndef SESSION_PATH_RESOLVER_HPP
#define SESSION_PATH_RESOLVER_HPP

#include <string>

#include "session/errors.hpp"

namespace session {

// Whether a symbolic link in the last position of a path is resolved.
enum class FinalComponent { kFollow, kNoFollow };

class PathResolver {
 public:
  // Maps relative_path to an absolute path below the real path of
  // sandbox_root, or throws path_traversal. Empty, absolute and ".."
  // segments, NUL bytes, dangling symlinks and symlinks pointing outside of
  // the root are rejected, as is any path that resolves to the root itself.
  // Components that do not exist yet are appended lexically.
  // Only lstat, readlink and realpath are used: nothing is modified.
  static std::string Resolve(const std::string& sandbox_root,
                             const std::string& relative_path,
                             FinalComponent final_component);

  // Whether path is root or lies below it. Both must be canonical.
  static bool IsContained(const std::string& root, const std::string& path);
};

}  // namespace session

#endif
