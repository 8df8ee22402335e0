#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP
#include <string>
#include <vector>

#include "sandbox/sandbox.hpp"

namespace sandbox {

// Sandbox for UNIX-like systems. The child runs in its own session and
// process group, with resource limits set through setrlimit, and the whole
// group is killed when it exceeds the wall time or memory limit, or when the
// main process exits.
class Unix : public Sandbox {
 public:
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) override;
  static Sandbox* Create() { return new Unix(); }
  static int Score() { return 2; }

  ~Unix() override;

 protected:
  Unix() = default;

  // Executed before creating the child process. Returns false and sets
  // error_msg if setup fails.
  bool Setup(std::string* error_msg);

  // Creates a child process and saves its PID in child_pid_. The child process
  // executes Child and does not return.
  bool DoFork(std::string* error_msg);

  // Function that is executed in the child process. It must only use
  // async-signal-safe functions, as the parent may be multi-threaded.
  [[noreturn]] void Child();

  // Waits for the termination of the child while collecting its output,
  // possibly killing it if it exceeds the wall time or memory limit.
  bool Wait(ExecutionInfo* info, std::string* error_msg);

  // Kills every process in the child's process group. The child must not
  // have been reaped yet.
  void KillGroup();

  void CloseFd(int* fd);

  int pipe_fds_[2] = {-1, -1};
  int stdout_fds_[2] = {-1, -1};
  int stderr_fds_[2] = {-1, -1};
  int child_pid_ = 0;
  const ExecutionOptions* options_ = nullptr;

  // argv and envp for execve, prepared before fork.
  std::vector<std::vector<char>> arg_storage_;
  std::vector<std::vector<char>> env_storage_;
  std::vector<char*> argv_;
  std::vector<char*> envp_;
};

}  // namespace sandbox
#endif
