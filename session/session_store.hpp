#ifndef SESSION_SESSION_STORE_HPP
#define SESSION_SESSION_STORE_HPP

#include <string>
#include <utility>

#include "session/errors.hpp"
#include "util/user.hpp"

namespace session {

// Maps session identifiers to their sandbox roots, one directory per session
// under a base directory. The directories are the only state: nothing is
// kept in memory, and sessions are never removed. New sandbox roots are
// handed to owner when it is set.
class SessionStore {
 public:
  explicit SessionStore(std::string base_directory,
                        util::User owner = util::User())
      : base_directory_(std::move(base_directory)), owner_(owner) {}

  // Returns the sandbox root of session_id, creating it if needed.
  std::string GetOrCreate(const std::string& session_id) const;

  // Copies the tree of session_id into a new session and returns its id.
  // Either the new session is complete or it does not exist at all.
  std::string Fork(const std::string& session_id) const;

  bool Exists(const std::string& session_id) const;

  // Sandbox root of session_id, whether it exists or not.
  std::string Root(const std::string& session_id) const;

  // Throws invalid_input unless id is 1 to 128 characters out of
  // [A-Za-z0-9._-] and does not start with a dot.
  static void ValidateId(const std::string& id);

  const std::string& BaseDirectory() const { return base_directory_; }

 private:
  std::string base_directory_;
  util::User owner_;
};

}  // namespace session

#endif
