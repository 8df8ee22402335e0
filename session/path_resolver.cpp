#include "session/path_resolver.hpp"

#include <errno.h>
#include <limits.h>
#include <stdlib.h>
#include <sys/stat.h>

#include <memory>
#include <vector>

#include "absl/strings/string_view.h"
#include "absl/strings/str_split.h"
#include "util/file.hpp"

namespace {

// Returns false and sets errno on failure.
bool RealPath(const std::string& path, std::string* resolved) {
  std::unique_ptr<char, decltype(&free)> buf{realpath(path.c_str(), nullptr),
                                             &free};
  if (!buf) return false;
  *resolved = buf.get();
  return true;
}

}  // namespace

namespace session {

bool PathResolver::IsContained(const std::string& root,
                               const std::string& path) {
  if (path == root) return true;
  if (root == "/") return !path.empty() && path[0] == '/';
  return path.size() > root.size() && path.compare(0, root.size(), root) == 0 &&
         path[root.size()] == '/';
}

std::string PathResolver::Resolve(const std::string& sandbox_root,
                                  const std::string& relative_path,
                                  FinalComponent final_component) {
  if (relative_path.empty()) throw path_traversal("empty path");
  if (relative_path.find('\0') != std::string::npos) {
    throw path_traversal("NUL byte in path");
  }
  if (relative_path[0] == '/') {
    throw path_traversal("absolute path: " + relative_path);
  }

  std::vector<std::string> segments;
  for (absl::string_view segment : absl::StrSplit(relative_path, '/')) {
    if (segment.empty()) {
      throw path_traversal("empty segment in " + relative_path);
    }
    if (segment == "..") {
      throw path_traversal("parent reference in " + relative_path);
    }
    if (segment == ".") continue;
    segments.emplace_back(segment);
  }
  if (segments.empty()) {
    throw path_traversal("path is the sandbox root: " + relative_path);
  }

  std::string root;
  if (!RealPath(sandbox_root, &root)) {
    throw std::system_error(errno, std::system_category(),
                            "realpath " + sandbox_root);
  }

  std::string current = root;
  for (size_t i = 0; i < segments.size(); i++) {
    std::string candidate = util::File::JoinPath(current, segments[i]);
    struct stat st {};
    if (lstat(candidate.c_str(), &st) == -1) {
      if (errno != ENOENT && errno != ENOTDIR) {
        throw std::system_error(errno, std::system_category(),
                                "lstat " + candidate);
      }
      // Nothing below a missing component can exist, so no symlink can
      // appear in the rest of the path.
      current = candidate;
      for (size_t j = i + 1; j < segments.size(); j++) {
        current = util::File::JoinPath(current, segments[j]);
      }
      break;
    }
    const bool last = i + 1 == segments.size();
    if (!S_ISLNK(st.st_mode) ||
        (last && final_component == FinalComponent::kNoFollow)) {
      current = candidate;
      continue;
    }
    std::string target;
    if (!RealPath(candidate, &target)) {
      throw path_traversal("dangling symlink: " + relative_path);
    }
    if (!IsContained(root, target)) {
      throw path_traversal("symlink escapes the sandbox: " + relative_path);
    }
    current = target;
  }
  if (current == root) {
    throw path_traversal("path is the sandbox root: " + relative_path);
  }
  return current;
}

}  // namespace session
