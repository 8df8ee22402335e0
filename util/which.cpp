#include "util/which.hpp"

#include <unistd.h>

#include <cstdlib>
#include <mutex>
#include <stdexcept>
#include <unordered_map>
#include <vector>

#include "absl/strings/str_split.h"
#include "util/file.hpp"

namespace {
std::mutex cache_mutex;
std::unordered_map<std::string, std::string> cmd_cache;

bool IsExecutable(const std::string& path) {
  return util::File::IsRegularFile(path) && access(path.c_str(), X_OK) == 0;
}
}  // namespace

namespace util {

std::string which(const std::string& cmd, bool use_cache) {
  if (cmd.find('/') != std::string::npos) {
    return IsExecutable(cmd) ? cmd : "";
  }
  std::lock_guard<std::mutex> lck(cache_mutex);
  if (use_cache && cmd_cache.count(cmd) > 0) return cmd_cache[cmd];

  const char* path = std::getenv("PATH");
  if (path == nullptr) throw std::runtime_error("PATH is not set");
  std::vector<std::string> dirs = absl::StrSplit(path, ':', absl::SkipEmpty());

  for (const std::string& dir : dirs) {
    std::string fullpath = File::JoinPath(dir, cmd);
    if (IsExecutable(fullpath)) {
      if (use_cache) cmd_cache[cmd] = fullpath;
      return fullpath;
    }
  }
  return "";
}

}  // namespace util
