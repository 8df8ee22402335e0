#include "sandbox/unix.hpp"

#include <chrono>
#include <thread>

#include <errno.h>
#include <fcntl.h>
#include <grp.h>
#include <limits.h>
#include <poll.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "glog/logging.h"

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

// Resident set size of the given process, from /proc/pid/statm.
int GetProcessMemoryUsage(pid_t pid, int64_t* memory_usage_kb) {
  int fd = open(("/proc/" + std::to_string(pid) + "/statm").c_str(),
                O_RDONLY | O_CLOEXEC);
  if (fd == -1) return -1;
  char buf[1024] = {};
  ssize_t num_read = read(fd, buf, sizeof(buf) - 1);
  close(fd);
  if (num_read <= 0) return -1;
  long long size = 0;
  long long resident = 0;
  if (sscanf(buf, "%lld %lld", &size, &resident) != 2) return -1;
  static const long page_kb = sysconf(_SC_PAGESIZE) / 1024;
  *memory_usage_kb = resident * page_kb;
  return 0;
}

std::vector<char> ToCString(const std::string& s) {
  std::vector<char> v(s.begin(), s.end());
  v.push_back(0);
  return v;
}

// Appends whatever is readable from *fd to out, keeping at most max_bytes
// (if not zero). Closes and resets *fd on EOF or error.
void Drain(int* fd, int64_t max_bytes, std::string* out, bool* truncated) {
  char buf[32 * 1024];
  ssize_t amount = read(*fd, buf, sizeof(buf));
  if (amount == -1 && (errno == EINTR || errno == EAGAIN)) return;
  if (amount <= 0) {
    close(*fd);
    *fd = -1;
    return;
  }
  size_t keep = amount;
  if (max_bytes > 0) {
    size_t room = out->size() < static_cast<size_t>(max_bytes)
                      ? static_cast<size_t>(max_bytes) - out->size()
                      : 0;
    if (room < keep) {
      keep = room;
      *truncated = true;
    }
  }
  out->append(buf, keep);
}

// Waits up to timeout_millis for output on the open descriptors, and
// collects it.
void PollOutput(int* out_fd, int* err_fd, int64_t max_bytes,
                sandbox::ExecutionInfo* info, int timeout_millis) {
  struct pollfd fds[2] = {};
  int nfds = 0;
  if (*out_fd != -1) fds[nfds++] = {*out_fd, POLLIN, 0};
  if (*err_fd != -1) fds[nfds++] = {*err_fd, POLLIN, 0};
  if (nfds == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(timeout_millis));
    return;
  }
  if (poll(fds, nfds, timeout_millis) <= 0) return;
  for (int i = 0; i < nfds; i++) {
    if (!fds[i].revents) continue;
    if (fds[i].fd == *out_fd) {
      Drain(out_fd, max_bytes, &info->stdout_data, &info->stdout_truncated);
    } else {
      Drain(err_fd, max_bytes, &info->stderr_data, &info->stderr_truncated);
    }
  }
}

// How long output is still collected after the main process exited, in case
// a process that left the group keeps the pipes open.
static const constexpr int64_t kDrainMillis = 500;
static const constexpr int kPollMillis = 10;
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;

Unix::~Unix() {
  for (int* fd : {&pipe_fds_[0], &pipe_fds_[1], &stdout_fds_[0],
                  &stdout_fds_[1], &stderr_fds_[0], &stderr_fds_[1]}) {
    CloseFd(fd);
  }
}

void Unix::CloseFd(int* fd) {
  if (*fd != -1) close(*fd);
  *fd = -1;
}

bool Unix::Execute(const ExecutionOptions& options, ExecutionInfo* info,
                   std::string* error_msg) {
  options_ = &options;
  if (!Setup(error_msg)) return false;
  if (!DoFork(error_msg)) return false;
  if (!Wait(info, error_msg)) return false;
  return true;
}

bool Unix::Setup(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  // Close-on-exec from the start: other threads may fork at any time.
  for (int* fds : {pipe_fds_, stdout_fds_, stderr_fds_}) {
    if (pipe2(fds, O_CLOEXEC) == -1) {
      *error_msg = "pipe2: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      return false;
    }
  }
  for (int fd : {stdout_fds_[0], stderr_fds_[0]}) {
    if (fcntl(fd, F_SETFL, O_NONBLOCK) == -1) {
      *error_msg = "fcntl: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      return false;
    }
  }

  // The child must not allocate memory, so argv and envp are built here.
  arg_storage_.clear();
  env_storage_.clear();
  arg_storage_.push_back(ToCString(options_->executable));
  for (const std::string& arg : options_->args) {
    arg_storage_.push_back(ToCString(arg));
  }
  for (const std::string& var : options_->env) {
    env_storage_.push_back(ToCString(var));
  }
  argv_.clear();
  envp_.clear();
  for (std::vector<char>& arg : arg_storage_) argv_.push_back(arg.data());
  argv_.push_back(nullptr);
  for (std::vector<char>& var : env_storage_) envp_.push_back(var.data());
  envp_.push_back(nullptr);
  return true;
}

bool Unix::DoFork(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  if (fork_result) {
    child_pid_ = fork_result;
    return true;
  } else {
    Child();
  }
}

void Unix::Child() {
  close(pipe_fds_[0]);
  close(stdout_fds_[0]);
  close(stderr_fds_[0]);
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 3] = {};
    strncat(buf, prefix, 64);
    strncat(buf, ": ", 3);
    strncat(buf, err, kStrErrorBufSize);
    int len = strlen(buf);
    if (write(pipe_fds_[1], &len, sizeof(len)) == sizeof(len)) {
      ssize_t ignored = write(pipe_fds_[1], buf, len);
      (void)ignored;
    }
    close(pipe_fds_[1]);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));
  };

  // New session and process group, so that the whole group can be killed
  // and we do not receive Ctrl-Cs in the terminal.
  if (setsid() == -1) die("setsid", errno);
  if (prctl(PR_SET_PDEATHSIG, SIGKILL) == -1) die("prctl", errno);

  int stdin_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
  if (stdin_fd == -1) die("open", errno);

  // Handle I/O redirection.
  if (dup2(stdin_fd, STDIN_FILENO) == -1) die("redir stdin", errno);
  if (dup2(stdout_fds_[1], STDOUT_FILENO) == -1) die("redir stdout", errno);
  if (dup2(stderr_fds_[1], STDERR_FILENO) == -1) die("redir stderr", errno);

  if (chdir(options_->root.c_str()) == -1) {
    die("chdir", errno);
  }

  // Set resource limits.
  struct rlimit rlim {};
#define SET_RLIM(res, soft, hard)               \
  {                                             \
    rlim_t lim = soft;                          \
    if (lim) {                                  \
      rlim.rlim_cur = soft;                     \
      rlim.rlim_max = hard;                     \
      if (setrlimit(RLIMIT_##res, &rlim) < 0) { \
        die("setrlim " #res, errno);            \
      }                                         \
    }                                           \
  }

  // SIGXCPU at the soft limit, SIGKILL one second later.
  const rlim_t cpu_seconds = (options_->cpu_limit_millis + 999) / 1000;
  SET_RLIM(CPU, cpu_seconds, cpu_seconds + 1);
  SET_RLIM(AS, options_->memory_limit_kb * 1024,
           options_->memory_limit_kb * 1024);
  SET_RLIM(FSIZE, options_->max_file_size_kb * 1024,
           options_->max_file_size_kb * 1024);
  SET_RLIM(NOFILE, options_->max_files, options_->max_files);
  SET_RLIM(NPROC, options_->max_procs, options_->max_procs);
  SET_RLIM(STACK, options_->max_stack_kb * 1024, options_->max_stack_kb * 1024);
#undef SET_RLIM
  rlim.rlim_cur = rlim.rlim_max = 0;
  if (setrlimit(RLIMIT_CORE, &rlim) < 0) die("setrlim CORE", errno);

  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) == -1) die("prctl", errno);
  if (options_->gid != static_cast<gid_t>(-1)) {
    if (setgroups(0, nullptr) == -1) die("setgroups", errno);
    if (setgid(options_->gid) == -1) die("setgid", errno);
  }
  if (options_->uid != static_cast<uid_t>(-1)) {
    if (setuid(options_->uid) == -1) die("setuid", errno);
  }

  int count = 0;
  do {
    execve(options_->executable.c_str(), argv_.data(), envp_.data());
    usleep(100);
    // We try at most 16 times to avoid livelocks (which should not be possible,
    // but better safe than sorry).
  } while (errno == ETXTBSY && count++ < 16);
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

void Unix::KillGroup() {
  // The child may not have called setsid yet, so also kill it directly.
  kill(-child_pid_, SIGKILL);
  kill(child_pid_, SIGKILL);
}

bool Unix::Wait(ExecutionInfo* info, std::string* error_msg) {
  auto program_start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start)
        .count();
  };

  CloseFd(&pipe_fds_[1]);
  CloseFd(&stdout_fds_[1]);
  CloseFd(&stderr_fds_[1]);
  int error_len = 0;
  if (read(pipe_fds_[0], &error_len, sizeof(error_len)) == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    if (error_len < 0 || error_len >= PIPE_BUF) error_len = PIPE_BUF - 1;
    ssize_t got = read(pipe_fds_[0], error, error_len);
    if (got < 0) got = 0;
    *error_msg = std::string(error, got);
    int child_status = 0;
    waitpid(child_pid_, &child_status, 0);
    return false;
  }
  CloseFd(&pipe_fds_[0]);

  int64_t memory_usage = 0;
  while (true) {
    if (options_->wall_limit_millis &&
        elapsed_millis() >= options_->wall_limit_millis) {
      info->killed_for_wall_time = true;
      break;
    }
    int64_t mem = 0;
    if (GetProcessMemoryUsage(child_pid_, &mem) == 0 && mem > memory_usage) {
      memory_usage = mem;
    }
    if (options_->memory_limit_kb && memory_usage > options_->memory_limit_kb) {
      info->killed_for_memory = true;
      break;
    }
    PollOutput(&stdout_fds_[0], &stderr_fds_[0], options_->max_output_bytes,
               info, kPollMillis);
    // The exited child stays a zombie, so its pid and process group cannot be
    // reused before KillGroup.
    siginfo_t exited {};
    int ret =
        waitid(P_PID, child_pid_, &exited, WEXITED | WNOHANG | WNOWAIT);
    if (ret == -1 && errno == EINTR) continue;
    if (ret == -1) {
      char buf[kStrErrorBufSize] = {};
      *error_msg = "waitid: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      KillGroup();
      waitpid(child_pid_, nullptr, 0);
      return false;
    }
    if (exited.si_pid == child_pid_) break;
  }
  KillGroup();
  int child_status = 0;
  struct rusage rusage {};
  int ret;
  while ((ret = wait4(child_pid_, &child_status, 0, &rusage)) == -1 &&
         errno == EINTR) {
  }
  if (ret != child_pid_) {
    char buf[kStrErrorBufSize] = {};
    *error_msg = "wait4: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  info->wall_time_millis = elapsed_millis();

  // Collect what is left in the pipes.
  auto drain_start = std::chrono::steady_clock::now();
  while ((stdout_fds_[0] != -1 || stderr_fds_[0] != -1) &&
         std::chrono::steady_clock::now() - drain_start <
             std::chrono::milliseconds(kDrainMillis)) {
    PollOutput(&stdout_fds_[0], &stderr_fds_[0], options_->max_output_bytes,
               info, kPollMillis);
  }
  CloseFd(&stdout_fds_[0]);
  CloseFd(&stderr_fds_[0]);

  info->memory_usage_kb = std::max<int64_t>(memory_usage, rusage.ru_maxrss);
  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  info->cpu_time_millis =
      (int64_t)rusage.ru_utime.tv_sec * 1000 + rusage.ru_utime.tv_usec / 1000;
  info->sys_time_millis =
      (int64_t)rusage.ru_stime.tv_sec * 1000 + rusage.ru_stime.tv_usec / 1000;
  if (info->signal != 0) {
    info->message = strsignal(info->signal);
  } else if (info->status_code != 0) {
    info->message = "Non-zero return code";
  }
  VLOG(1) << "Child " << child_pid_ << " done: status " << info->status_code
          << " signal " << info->signal << " wall " << info->wall_time_millis
          << "ms cpu " << info->cpu_time_millis << "ms mem "
          << info->memory_usage_kb << "KiB";
  return true;
}

namespace {
Sandbox::Register<Unix> r;
}  // namespace

}  // namespace sandbox
