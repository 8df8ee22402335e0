#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

DECLARE_string(base_directory);
DECLARE_string(python);
DECLARE_int32(num_cores);

DECLARE_int64(run_wall_limit_ms);
DECLARE_int64(run_cpu_limit_ms);
DECLARE_int64(run_memory_limit_kb);
DECLARE_int64(eval_wall_limit_ms);
DECLARE_int64(eval_cpu_limit_ms);
DECLARE_int64(eval_memory_limit_kb);

DECLARE_int64(max_output_kb);
DECLARE_int32(max_processes);
DECLARE_int64(max_file_size_kb);
DECLARE_string(sandbox_user);

#endif
