#ifndef SESSION_FILE_MANAGER_HPP
#define SESSION_FILE_MANAGER_HPP

#include <string>

#include "session/errors.hpp"
#include "util/file.hpp"

namespace session {

// File operations on paths relative to a sandbox root. Every path goes
// through PathResolver first, so a rejected path never reaches the
// filesystem.
class FileManager {
 public:
  // Content of a regular file. Throws util::file_not_found otherwise.
  static std::string Read(const std::string& root, const std::string& path);

  // Creates or atomically replaces a file, making the missing directories.
  static void Write(const std::string& root, const std::string& path,
                    const std::string& content);

  // Removes a file, a symbolic link or an empty directory.
  static void Delete(const std::string& root, const std::string& path);

  // Moves old_path to new_path, replacing new_path if it exists.
  static void Rename(const std::string& root, const std::string& old_path,
                     const std::string& new_path);
};

}  // namespace session

#endif
