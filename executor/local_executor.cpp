#include "executor/local_executor.hpp"

#include <signal.h>

#include <algorithm>
#include <memory>
#include <stdexcept>

#include "absl/strings/str_join.h"
#include "glog/logging.h"
#include "util/flags.hpp"
#include "util/user.hpp"
#include "util/which.hpp"

namespace {
static const constexpr char* kChildPath = "/usr/local/bin:/usr/bin:/bin";

// A crash this close to the memory limit is most likely a failed allocation.
static const constexpr double kMemoryCrashRatio = 0.95;

int64_t CappedLimit(int64_t requested, int64_t deflt) {
  if (requested <= 0) return deflt;
  if (deflt <= 0) return requested;
  return std::min(requested, deflt);
}
}  // namespace

namespace executor {

Limits Limits::Capped(const proto::Resources& requested,
                      const Limits& defaults) {
  Limits limits;
  limits.cpu_time_ms =
      CappedLimit(requested.cpu_time_ms(), defaults.cpu_time_ms);
  limits.wall_time_ms =
      CappedLimit(requested.wall_time_ms(), defaults.wall_time_ms);
  limits.memory_kb = CappedLimit(requested.memory_kb(), defaults.memory_kb);
  return limits;
}

LocalExecutor::LocalExecutor()
    : max_output_bytes_(FLAGS_max_output_kb * 1024),
      max_procs_(FLAGS_max_processes),
      max_file_size_kb_(FLAGS_max_file_size_kb) {
  util::User user = util::SandboxUser();
  uid_ = user.uid;
  gid_ = user.gid;
}

std::vector<std::string> LocalExecutor::Environment(
    const std::string& root) const {
  return {std::string("PATH=") + kChildPath, "HOME=" + root, "LANG=C.UTF-8",
          "PYTHONDONTWRITEBYTECODE=1"};
}

proto::ExecutionResult LocalExecutor::Run(
    const std::string& root, const std::vector<std::string>& command,
    const Limits& limits) {
  proto::ExecutionResult result;
  if (command.empty()) {
    throw std::invalid_argument("Empty command");
  }
  std::string executable = util::which(command[0]);
  if (executable.empty()) {
    result.set_status(proto::Status::INTERNAL_ERROR);
    result.set_error_message("Command not found: " + command[0]);
    return result;
  }

  sandbox::ExecutionOptions exec_options(root, executable);
  exec_options.args.assign(command.begin() + 1, command.end());
  exec_options.env = Environment(root);
  exec_options.cpu_limit_millis = limits.cpu_time_ms;
  exec_options.wall_limit_millis = limits.wall_time_ms;
  exec_options.memory_limit_kb = limits.memory_kb;
  exec_options.max_procs = max_procs_;
  exec_options.max_file_size_kb = max_file_size_kb_;
  exec_options.max_output_bytes = max_output_bytes_;
  exec_options.uid = uid_;
  exec_options.gid = gid_;

  VLOG(1) << "Executing [" << absl::StrJoin(command, " ") << "] in " << root
          << " cpu " << limits.cpu_time_ms << "ms wall " << limits.wall_time_ms
          << "ms mem " << limits.memory_kb << "KiB";

  sandbox::ExecutionInfo info;
  std::string error_msg;
  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  if (!sb) {
    throw std::runtime_error("No sandbox available");
  }
  if (!sb->Execute(exec_options, &info, &error_msg)) {
    LOG(WARNING) << "Failed to start " << executable << ": " << error_msg;
    result.set_status(proto::Status::INTERNAL_ERROR);
    result.set_error_message(error_msg);
    return result;
  }

  // Resource usage.
  result.mutable_resource_usage()->set_cpu_time_ms(info.cpu_time_millis);
  result.mutable_resource_usage()->set_sys_time_ms(info.sys_time_millis);
  result.mutable_resource_usage()->set_wall_time_ms(info.wall_time_millis);
  result.mutable_resource_usage()->set_memory_kb(info.memory_usage_kb);

  // Termination status.
  result.set_status_code(info.status_code);
  result.set_signal(info.signal);
  Classify(info, limits, &result);

  // Output.
  result.set_stdout_truncated(info.stdout_truncated);
  result.set_stderr_truncated(info.stderr_truncated);
  *result.mutable_stdout_data() = std::move(info.stdout_data);
  *result.mutable_stderr_data() = std::move(info.stderr_data);

  VLOG(1) << "Execution of " << command[0] << " finished: "
          << proto::Status_Name(result.status()) << " "
          << result.error_message();
  return result;
}

void LocalExecutor::Classify(const sandbox::ExecutionInfo& info,
                             const Limits& limits,
                             proto::ExecutionResult* result) {
  const bool crashed = info.signal == SIGSEGV || info.signal == SIGABRT;
  if (info.killed_for_wall_time) {
    result->set_status(proto::Status::WALL_TIME_LIMIT);
    result->set_error_message("Wall limit exceeded");
  } else if (info.killed_for_memory ||
             (limits.memory_kb && info.memory_usage_kb >= limits.memory_kb) ||
             (limits.memory_kb && crashed &&
              info.memory_usage_kb >= kMemoryCrashRatio * limits.memory_kb)) {
    result->set_status(proto::Status::MEMORY_LIMIT);
    result->set_error_message("Memory limit exceeded");
  } else if (info.signal == SIGXCPU ||
             (limits.cpu_time_ms &&
              info.cpu_time_millis + info.sys_time_millis >=
                  limits.cpu_time_ms)) {
    result->set_status(proto::Status::CPU_TIME_LIMIT);
    result->set_error_message("CPU limit exceeded");
  } else if (info.signal) {
    result->set_status(proto::Status::SIGNAL);
    result->set_error_message(info.message);
  } else if (info.status_code) {
    result->set_status(proto::Status::NONZERO);
    result->set_error_message(info.message);
  } else {
    result->set_status(proto::Status::SUCCESS);
  }
}

}  // namespace executor
