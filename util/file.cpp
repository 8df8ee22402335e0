#include "util/file.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <ftw.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <memory>
#include <vector>

#include "glog/logging.h"

namespace {

static const constexpr char* kPathSeparators = "/";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH) != -1 ||
         errno == EEXIST;
}

[[noreturn]] void ThrowErrno(const std::string& what) {
  int err = errno;
  if (err == ENOENT) throw util::file_not_found(what);
  if (err == EEXIST) throw util::file_exists(what);
  throw std::system_error(err, std::system_category(), what);
}

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* sb, int typeflags,
                 struct FTW* ftwbuf) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

std::string OsTempDir(const std::string& path) {
  std::string tmp = path + "XXXXXX";
  std::unique_ptr<char[]> data{strdup(tmp.c_str())};
  if (mkdtemp(data.get()) == nullptr) {
    return "";
  }
  return data.get();
}

int OsTempFile(const std::string& path, const std::string& suffix,
               std::string* tmp) {
  *tmp = path + "XXXXXX" + suffix;
  std::unique_ptr<char[]> data{strdup(tmp->c_str())};
  int fd = mkostemps(data.get(), suffix.size(), O_CLOEXEC);
  *tmp = data.get();
  return fd;
}

// Returns errno, or 0 on success.
int OsWriteAll(int fd, const char* data, size_t size) {
  size_t pos = 0;
  while (pos < size) {
    ssize_t written = write(fd, data + pos, size - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) return errno;
    pos += written;
  }
  return 0;
}

// Returns errno, or 0 on success.
int OsRead(const std::string& path,
           const util::File::ChunkReceiver& chunk_receiver) {
  int fd = open(path.c_str(), O_CLOEXEC | O_RDONLY);
  if (fd == -1) return errno;
  char buf[util::kChunkSize] = {};
  ssize_t amount;
  try {
    while ((amount = read(fd, buf, util::kChunkSize))) {
      if (amount == -1 && errno == EINTR) continue;
      if (amount == -1) break;
      chunk_receiver(buf, amount);
    }
  } catch (...) {
    close(fd);
    throw;
  }
  if (amount == -1) {
    int error = errno;
    close(fd);
    return error;
  }
  return close(fd) == -1 ? errno : 0;
}

// Returns errno, or 0 on success.
int OsWrite(const std::string& path, const std::string& content,
            bool overwrite) {
  std::string temp_file;
  int fd = OsTempFile(path + ".", "", &temp_file);
  if (fd == -1) return errno;
  int err = OsWriteAll(fd, content.data(), content.size());
  if (!err && fchmod(fd, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH) == -1) {
    err = errno;
  }
  if (close(fd) == -1 && !err) err = errno;
  if (!err) {
    if (overwrite) {
      if (rename(temp_file.c_str(), path.c_str()) == -1) err = errno;
    } else if (link(temp_file.c_str(), path.c_str()) == -1) {
      err = errno;
    }
  }
  if (err || !overwrite) unlink(temp_file.c_str());
  return err;
}

int OsCopyFile(const std::string& from, const std::string& to, mode_t mode) {
  int in = open(from.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC);
  if (in == -1) return errno;
  int out = open(to.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, mode);
  if (out == -1) {
    int error = errno;
    close(in);
    return error;
  }
  char buf[util::kChunkSize] = {};
  int err = 0;
  ssize_t amount;
  while ((amount = read(in, buf, util::kChunkSize))) {
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) {
      err = errno;
      break;
    }
    err = OsWriteAll(out, buf, amount);
    if (err) break;
  }
  close(in);
  if (close(out) == -1 && !err) err = errno;
  return err;
}

void CopyTreeInternal(const std::string& from, const std::string& to) {
  DIR* dir = opendir(from.c_str());
  if (dir == nullptr) ThrowErrno("opendir " + from);
  std::vector<std::string> entries;
  errno = 0;
  while (struct dirent* ent = readdir(dir)) {
    if (strcmp(ent->d_name, ".") == 0 || strcmp(ent->d_name, "..") == 0)
      continue;
    entries.emplace_back(ent->d_name);
  }
  int readdir_errno = errno;
  closedir(dir);
  if (readdir_errno) {
    throw std::system_error(readdir_errno, std::system_category(),
                            "readdir " + from);
  }

  for (const std::string& name : entries) {
    std::string src = util::File::JoinPath(from, name);
    std::string dst = util::File::JoinPath(to, name);
    struct stat st {};
    if (lstat(src.c_str(), &st) == -1) ThrowErrno("lstat " + src);
    if (S_ISDIR(st.st_mode)) {
      if (mkdir(dst.c_str(), S_IRWXU) == -1) ThrowErrno("mkdir " + dst);
      CopyTreeInternal(src, dst);
      if (chmod(dst.c_str(), st.st_mode & 07777) == -1) {
        ThrowErrno("chmod " + dst);
      }
    } else if (S_ISREG(st.st_mode)) {
      int err = OsCopyFile(src, dst, st.st_mode & 07777);
      if (err) {
        throw std::system_error(err, std::system_category(), "copy " + src);
      }
    } else if (S_ISLNK(st.st_mode)) {
      std::vector<char> target(st.st_size + 1);
      ssize_t len = readlink(src.c_str(), target.data(), target.size());
      if (len == -1) ThrowErrno("readlink " + src);
      target.resize(len);
      target.push_back('\0');
      if (symlink(target.data(), dst.c_str()) == -1) {
        ThrowErrno("symlink " + dst);
      }
    } else {
      LOG(WARNING) << "Not copying special file " << src;
    }
  }
}

}  // namespace

namespace util {

void File::Read(const std::string& path,
                const File::ChunkReceiver& chunk_receiver) {
  int err = OsRead(path, chunk_receiver);
  if (err == ENOENT) throw file_not_found("Read " + path);
  if (err) throw std::system_error(err, std::system_category(), "Read " + path);
}

std::string File::Read(const std::string& path) {
  std::string content;
  Read(path, [&content](const char* data, size_t size) {
    content.append(data, size);
  });
  return content;
}

void File::Write(const std::string& path, const std::string& content,
                 bool overwrite) {
  MakeDirs(BaseDir(path));
  int err = OsWrite(path, content, overwrite);
  if (err == EEXIST) throw file_exists("Write " + path);
  if (err)
    throw std::system_error(err, std::system_category(), "Write " + path);
}

void File::MakeDirs(const std::string& path) {
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir " + path);
    }
  }
}

void File::CopyTree(const std::string& from, const std::string& to) {
  CopyTreeInternal(from, to);
}

void File::Move(const std::string& from, const std::string& to) {
  if (rename(from.c_str(), to.c_str()) == -1) ThrowErrno("rename " + from);
}

void File::Remove(const std::string& path) {
  if (remove(path.c_str()) == -1) ThrowErrno("remove " + path);
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path))
    throw std::system_error(errno, std::system_category(), "removetree");
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (!second.empty() && strchr(kPathSeparators, second[0])) return second;
  if (!first.empty() && first.back() == kPathSeparators[0])
    return first + second;
  return first + kPathSeparators[0] + second;
}

std::string File::BaseDir(const std::string& path) {
  size_t pos = path.find_last_of(kPathSeparators);
  if (pos == std::string::npos) return ".";
  if (pos == 0) return kPathSeparators;
  return path.substr(0, pos);
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

int64_t File::Size(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) == -1) return -1;
  return st.st_size;
}

bool File::IsDirectory(const std::string& path) {
  struct stat st {};
  return stat(path.c_str(), &st) != -1 && S_ISDIR(st.st_mode);
}

bool File::IsRegularFile(const std::string& path) {
  struct stat st {};
  return stat(path.c_str(), &st) != -1 && S_ISREG(st.st_mode);
}

TempDir::TempDir(const std::string& base, const std::string& prefix) {
  File::MakeDirs(base);
  path_ = OsTempDir(File::JoinPath(base, prefix));
  if (path_ == "")
    throw std::system_error(errno, std::system_category(), "mkdtemp");
}
void TempDir::Keep() { keep_ = true; }
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {
  if (keep_ || path_.empty()) return;
  if (!OsRemoveTree(path_)) {
    PLOG(WARNING) << "Failed to remove " << path_;
  }
}

TempFile::TempFile(const std::string& dir, const std::string& prefix,
                   const std::string& suffix, const std::string& content) {
  int fd = OsTempFile(File::JoinPath(dir, prefix), suffix, &path_);
  if (fd == -1) ThrowErrno("mkostemps " + path_);
  int err = OsWriteAll(fd, content.data(), content.size());
  if (!err && fchmod(fd, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH) == -1) {
    err = errno;
  }
  if (close(fd) == -1 && !err) err = errno;
  if (err) {
    unlink(path_.c_str());
    throw std::system_error(err, std::system_category(), "write " + path_);
  }
}

TempFile::~TempFile() {
  if (unlink(path_.c_str()) == -1 && errno != ENOENT) {
    PLOG(WARNING) << "Failed to remove " << path_;
  }
}

}  // namespace util
