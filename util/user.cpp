#include "util/user.hpp"

#include <errno.h>
#include <ftw.h>
#include <pwd.h>
#include <unistd.h>

#include <stdexcept>
#include <system_error>
#include <vector>

#include "glog/logging.h"
#include "util/flags.hpp"

namespace {
// nftw takes no context argument.
thread_local util::User tree_owner;
}  // namespace

namespace util {

User LookupUser(const std::string& name) {
  struct passwd pwd {};
  struct passwd* found = nullptr;
  std::vector<char> buf(16384);
  int err = getpwnam_r(name.c_str(), &pwd, buf.data(), buf.size(), &found);
  if (err != 0) {
    throw std::system_error(err, std::system_category(), "getpwnam_r");
  }
  if (found == nullptr) {
    throw std::runtime_error("Unknown user: " + name);
  }
  User user;
  user.uid = pwd.pw_uid;
  user.gid = pwd.pw_gid;
  return user;
}

User SandboxUser() {
  if (FLAGS_sandbox_user.empty()) return User();
  if (geteuid() != 0) {
    LOG(WARNING) << "Not running as root, ignoring --sandbox_user="
                 << FLAGS_sandbox_user;
    return User();
  }
  return LookupUser(FLAGS_sandbox_user);
}

void Chown(const std::string& path, const User& user) {
  if (!user.IsSet()) return;
  if (lchown(path.c_str(), user.uid, user.gid) == -1) {
    throw std::system_error(errno, std::system_category(), "lchown " + path);
  }
}

void ChownTree(const std::string& path, const User& user) {
  if (!user.IsSet()) return;
  tree_owner = user;
  int ret = nftw(
      path.c_str(),
      [](const char* fpath, const struct stat* sb, int typeflags,
         struct FTW* ftwbuf) {
        return lchown(fpath, tree_owner.uid, tree_owner.gid);
      },
      64, FTW_PHYS | FTW_MOUNT);
  if (ret == -1) {
    throw std::system_error(errno, std::system_category(), "lchown " + path);
  }
}

}  // namespace util
