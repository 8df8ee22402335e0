#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP
#include <functional>
#include <string>
#include <system_error>

namespace util {

class file_exists : public std::system_error {
 public:
  explicit file_exists(const std::string& msg)
      : std::system_error(EEXIST, std::system_category(), msg) {}
};

class file_not_found : public std::system_error {
 public:
  explicit file_not_found(const std::string& msg)
      : std::system_error(ENOENT, std::system_category(), msg) {}
};

static const constexpr uint32_t kChunkSize = 32 * 1024;

class File {
 public:
  using ChunkReceiver = std::function<void(const char* data, size_t size)>;

  // Reads the file specified by path in chunks.
  static void Read(const std::string& path,
                   const ChunkReceiver& chunk_receiver);

  // Reads the whole file specified by path.
  static std::string Read(const std::string& path);

  // Atomically replaces the content of path with content, creating the
  // missing parent folders. If overwrite is false and the file already
  // exists, file_exists is thrown.
  static void Write(const std::string& path, const std::string& content,
                    bool overwrite = true);

  // Creates all the folder that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Recursively copies the tree rooted at from into the existing directory
  // to. Symbolic links are copied as links, file modes are preserved.
  // Special files (FIFOs, sockets, devices) are skipped.
  static void CopyTree(const std::string& from, const std::string& to);

  // Moves a file or a directory to a new position, replacing the destination
  // file if present.
  static void Move(const std::string& from, const std::string& to);

  // Removes a file, a symbolic link or an empty directory.
  static void Remove(const std::string& path);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Computes the file name for a path
  static std::string BaseName(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);

  static bool IsDirectory(const std::string& path);
  static bool IsRegularFile(const std::string& path);
};

// Creates a temporary directory in a given folder. The folder will be
// (recursively) removed on destruction.
class TempDir {
 public:
  // base is the directory in which the temporary directory will be created,
  // if needed along with base itself.
  // The name of the directory starts with prefix.
  explicit TempDir(const std::string& base, const std::string& prefix = "");
  const std::string& Path() const;

  // Disables automatic deletion of the folder.
  void Keep();
  ~TempDir();

  TempDir(TempDir&& other) noexcept { *this = std::move(other); }
  TempDir& operator=(TempDir&& other) noexcept {
    path_ = std::move(other.path_);
    keep_ = other.keep_;
    other.keep_ = true;
    return *this;
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

 private:
  std::string path_;
  bool keep_ = false;
};

// Creates a file with a unique name of the form prefix + XXXXXX + suffix
// inside dir and writes content to it. The file is readable by everyone, so
// that processes running as another user can load it. It is removed on
// destruction.
class TempFile {
 public:
  TempFile(const std::string& dir, const std::string& prefix,
           const std::string& suffix, const std::string& content);
  const std::string& Path() const { return path_; }
  ~TempFile();

  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;
  TempFile(TempFile&&) = delete;
  TempFile& operator=(TempFile&&) = delete;

 private:
  std::string path_;
};

}  // namespace util

#endif
