#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <sys/types.h>

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sandbox {

// What to run and under which limits. Zero limits are not enforced.
struct ExecutionOptions {
  int64_t cpu_limit_millis = 0;
  int64_t wall_limit_millis = 0;
  int64_t memory_limit_kb = 0;
  int32_t max_procs = 0;
  int32_t max_files = 0;
  int64_t max_file_size_kb = 0;
  int64_t max_stack_kb = 0;

  // Bytes of stdout and stderr that are kept, each. Zero means unbounded.
  int64_t max_output_bytes = 0;

  // Credentials to switch to before exec, -1 to keep the current ones.
  uid_t uid = static_cast<uid_t>(-1);
  gid_t gid = static_cast<gid_t>(-1);

  // Arguments after argv[0] and the full environment, as NAME=value.
  std::vector<std::string> args;
  std::vector<std::string> env;

  // Working directory of the child and path of the program.
  std::string root;
  std::string executable;
  ExecutionOptions(std::string root, std::string executable)
      : root(std::move(root)), executable(std::move(executable)) {}
};

// Outcome of a command that was started.
struct ExecutionInfo {
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  int64_t memory_usage_kb = 0;
  int32_t status_code = 0;
  int32_t signal = 0;

  // Set when the sandbox itself killed the process because of a limit.
  bool killed_for_wall_time = false;
  bool killed_for_memory = false;

  std::string stdout_data;
  std::string stderr_data;
  bool stdout_truncated = false;
  bool stderr_truncated = false;

  std::string message;
};

// A way of running one untrusted command under resource limits.
// Implementations register with a global Sandbox::Register<Impl> object and
// provide two static functions: Create, returning a new instance, and Score,
// rating the implementation on this machine. A negative score means the
// implementation is unusable here; otherwise Create() picks the highest one.
// Registration happens during static initialization only.
class Sandbox {
 public:
  using create_t = std::function<Sandbox*()>;
  using score_t = std::function<int()>;
  static std::unique_ptr<Sandbox> Create();

  // Runs the specified command. Returns true if the program was started,
  // and sets fields in info. Otherwise, returns false and sets error_msg.
  // A Sandbox instance runs one command at a time; use one instance per
  // thread.
  virtual bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) = 0;

  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;

  template <typename T>
  class Register {
   public:
    Register() { Sandbox::Register_(&T::Create, &T::Score); }
  };

 private:
  using store_t = std::vector<std::pair<create_t, score_t>>;
  static store_t* Boxes_();
  static void Register_(create_t, score_t);
  template <typename T>
  friend class Register;
};

}  // namespace sandbox

#endif
