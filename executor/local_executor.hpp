#ifndef EXECUTOR_LOCAL_EXECUTOR_HPP
#define EXECUTOR_LOCAL_EXECUTOR_HPP

#include <sys/types.h>

#include "executor/executor.hpp"
#include "sandbox/sandbox.hpp"

namespace executor {

// Executes commands on this machine through the best available sandbox.
class LocalExecutor : public Executor {
 public:
  proto::ExecutionResult Run(const std::string& root,
                             const std::vector<std::string>& command,
                             const Limits& limits) override;

  // Fills the status and error message of result from the raw sandbox
  // outcome, according to the limits that were applied.
  static void Classify(const sandbox::ExecutionInfo& info, const Limits& limits,
                       proto::ExecutionResult* result);

  // Reads the process-wide settings (output cap, rlimits, sandbox user) from
  // the command line flags. Throws if --sandbox_user does not exist.
  LocalExecutor();
  ~LocalExecutor() override = default;
  LocalExecutor(const LocalExecutor&) = delete;
  LocalExecutor& operator=(const LocalExecutor&) = delete;
  LocalExecutor(LocalExecutor&&) = delete;
  LocalExecutor& operator=(LocalExecutor&&) = delete;

 private:
  std::vector<std::string> Environment(const std::string& root) const;

  int64_t max_output_bytes_ = 0;
  int32_t max_procs_ = 0;
  int64_t max_file_size_kb_ = 0;
  uid_t uid_ = static_cast<uid_t>(-1);
  gid_t gid_ = static_cast<gid_t>(-1);
};

}  // namespace executor

#endif
