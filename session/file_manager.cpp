#include "session/file_manager.hpp"

#include <errno.h>
#include <limits.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include "absl/strings/str_split.h"
#include "session/path_resolver.hpp"
#include "util/user.hpp"

namespace {
bool Exists(const std::string& path) {
  struct stat st {};
  return lstat(path.c_str(), &st) != -1;
}

// Files created on behalf of the caller belong to the owner of the sandbox
// root. Only root can give files away.
util::User SessionOwner(const std::string& real_root) {
  struct stat st {};
  if (stat(real_root.c_str(), &st) == -1) {
    throw std::system_error(errno, std::system_category(), "stat " + real_root);
  }
  util::User owner;
  if (geteuid() == 0 && st.st_uid != 0) {
    owner.uid = st.st_uid;
    owner.gid = st.st_gid;
  }
  return owner;
}

std::string RealPath(const std::string& path) {
  char real[PATH_MAX];
  if (realpath(path.c_str(), real) == nullptr) {
    throw std::system_error(errno, std::system_category(), "realpath " + path);
  }
  return real;
}

// Creates the missing directories between the root and the parent of
// resolved, which must lie below real_root. Throws invalid_input if one of
// them exists and is not a directory.
void MakeParents(const std::string& real_root, const std::string& resolved,
                 const std::string& path, const util::User& owner) {
  std::string parent = util::File::BaseDir(resolved);
  if (parent.size() <= real_root.size()) return;
  std::string current = real_root;
  for (absl::string_view segment : absl::StrSplit(
           parent.substr(real_root.size()), '/', absl::SkipEmpty())) {
    current = util::File::JoinPath(current, std::string(segment));
    struct stat st {};
    if (stat(current.c_str(), &st) == 0) {
      if (!S_ISDIR(st.st_mode)) {
        throw session::invalid_input("Not a directory: " +
                                     current.substr(real_root.size() + 1) +
                                     " in " + path);
      }
      continue;
    }
    if (errno != ENOENT) {
      throw std::system_error(errno, std::system_category(), "stat " + current);
    }
    if (mkdir(current.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH) == -1) {
      if (errno != EEXIST) {
        throw std::system_error(errno, std::system_category(),
                                "mkdir " + current);
      }
      if (!util::File::IsDirectory(current)) {
        throw session::invalid_input("Not a directory: " + path);
      }
      continue;
    }
    util::Chown(current, owner);
  }
}
}  // namespace

namespace session {

std::string FileManager::Read(const std::string& root,
                              const std::string& path) {
  std::string resolved =
      PathResolver::Resolve(root, path, FinalComponent::kFollow);
  if (!util::File::IsRegularFile(resolved)) {
    throw util::file_not_found("No such file: " + path);
  }
  return util::File::Read(resolved);
}

void FileManager::Write(const std::string& root, const std::string& path,
                        const std::string& content) {
  std::string resolved =
      PathResolver::Resolve(root, path, FinalComponent::kFollow);
  if (util::File::IsDirectory(resolved)) {
    throw invalid_input("Is a directory: " + path);
  }
  std::string real_root = RealPath(root);
  util::User owner = SessionOwner(real_root);
  MakeParents(real_root, resolved, path, owner);
  util::File::Write(resolved, content);
  util::Chown(resolved, owner);
}

void FileManager::Delete(const std::string& root, const std::string& path) {
  std::string resolved =
      PathResolver::Resolve(root, path, FinalComponent::kNoFollow);
  if (!Exists(resolved)) {
    throw util::file_not_found("No such file: " + path);
  }
  try {
    util::File::Remove(resolved);
  } catch (const std::system_error& exc) {
    if (exc.code().value() == ENOTEMPTY || exc.code().value() == EEXIST) {
      throw invalid_input("Directory not empty: " + path);
    }
    throw;
  }
}

void FileManager::Rename(const std::string& root, const std::string& old_path,
                         const std::string& new_path) {
  std::string from =
      PathResolver::Resolve(root, old_path, FinalComponent::kNoFollow);
  std::string to =
      PathResolver::Resolve(root, new_path, FinalComponent::kNoFollow);
  if (!Exists(from)) {
    throw util::file_not_found("No such file: " + old_path);
  }
  if (from != to && PathResolver::IsContained(from, to)) {
    throw invalid_input("Cannot move a directory inside itself: " + old_path +
                        " to " + new_path);
  }
  std::string real_root = RealPath(root);
  MakeParents(real_root, to, new_path, SessionOwner(real_root));
  try {
    util::File::Move(from, to);
  } catch (const std::system_error& exc) {
    switch (exc.code().value()) {
      case EINVAL:
        throw invalid_input("Cannot move a directory inside itself: " +
                            old_path + " to " + new_path);
      case EISDIR:
      case ENOTDIR:
      case ENOTEMPTY:
      case EEXIST:
        throw invalid_input(std::string(exc.code().message()) + ": " +
                            old_path + " to " + new_path);
      default:
        throw;
    }
  }
}

}  // namespace session
