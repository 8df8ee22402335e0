#ifndef SESSION_ERRORS_HPP
#define SESSION_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <system_error>

namespace session {

// A relative path is malformed or would leave the sandbox root.
class path_traversal : public std::system_error {
 public:
  explicit path_traversal(const std::string& msg)
      : std::system_error(EACCES, std::system_category(), msg) {}
};

class session_not_found : public std::system_error {
 public:
  explicit session_not_found(const std::string& session_id)
      : std::system_error(ENOENT, std::system_category(),
                          "session not found: " + session_id) {}
};

// A request argument failed validation before any work was done.
class invalid_input : public std::invalid_argument {
 public:
  explicit invalid_input(const std::string& msg)
      : std::invalid_argument(msg) {}
};

}  // namespace session

#endif
