#ifndef EXECUTOR_EXECUTOR_HPP
#define EXECUTOR_EXECUTOR_HPP
#include <string>
#include <vector>

#include "proto/execution.pb.h"

namespace executor {

// Resource limits of a single execution. Zero means unlimited.
struct Limits {
  int64_t cpu_time_ms = 0;
  int64_t wall_time_ms = 0;
  int64_t memory_kb = 0;

  // Limits requested by a client, capped at the given defaults. Unset
  // (zero or negative) fields take the default value.
  static Limits Capped(const proto::Resources& requested,
                       const Limits& defaults);
};

class Executor {
 public:
  // Runs command (argv[0] is looked up in PATH if it has no slash) inside
  // root and returns its result. Failures to start the process are reported
  // as INTERNAL_ERROR results, not thrown.
  virtual proto::ExecutionResult Run(const std::string& root,
                                     const std::vector<std::string>& command,
                                     const Limits& limits) = 0;

  Executor() = default;
  virtual ~Executor() = default;
  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;
  Executor(Executor&&) = delete;
  Executor& operator=(Executor&&) = delete;
};

}  // namespace executor

#endif
