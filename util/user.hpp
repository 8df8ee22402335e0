#ifndef UTIL_USER_HPP
#define UTIL_USER_HPP

#include <sys/types.h>

#include <string>

namespace util {

// Owner of sandboxed processes and of the files they must be able to change.
// -1 means "keep the current one".
struct User {
  uid_t uid = static_cast<uid_t>(-1);
  gid_t gid = static_cast<gid_t>(-1);

  bool IsSet() const {
    return uid != static_cast<uid_t>(-1) || gid != static_cast<gid_t>(-1);
  }
};

// Looks name up in the password database. Throws if it does not exist.
User LookupUser(const std::string& name);

// The user from --sandbox_user, or an unset User if the flag is empty or the
// process cannot switch users.
User SandboxUser();

// Changes the owner of path, without following a final symlink. Does nothing
// if user is unset.
void Chown(const std::string& path, const User& user);

// Same as Chown, for every entry of the tree rooted at path.
void ChownTree(const std::string& path, const User& user);

}  // namespace util

#endif
