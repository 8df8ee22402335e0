#include "util/flags.hpp"

DEFINE_string(base_directory, "/tmp/sessionbox",
              "Directory holding one sandbox root per session");
DEFINE_string(python, "python3",
              "Python interpreter used to evaluate code, looked up in PATH");
DEFINE_int32(
    num_cores, 0,
    "Number of test cases to evaluate in parallel. If unset, autodetect");

DEFINE_int64(run_wall_limit_ms, 30000, "Wall time limit for Run commands");
DEFINE_int64(run_cpu_limit_ms, 30000, "CPU time limit for Run commands");
DEFINE_int64(run_memory_limit_kb, 2 * 1024 * 1024,
             "Address space limit for Run commands");
DEFINE_int64(eval_wall_limit_ms, 5000,
             "Wall time limit for each evaluation case");
DEFINE_int64(eval_cpu_limit_ms, 4000,
             "CPU time limit for each evaluation case");
DEFINE_int64(eval_memory_limit_kb, 2 * 1024 * 1024,
             "Address space limit for each evaluation case");

DEFINE_int64(max_output_kb, 1024,
             "Captured bytes of stdout and stderr, each. Excess is dropped");
DEFINE_int32(max_processes, 0, "RLIMIT_NPROC for sandboxed processes");
DEFINE_int64(max_file_size_kb, 0, "RLIMIT_FSIZE for sandboxed processes");
DEFINE_string(sandbox_user, "",
              "When running as root, execute sandboxed processes as this user");
