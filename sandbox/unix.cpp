#include "sandbox/unix.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>
#include <utility>
#include <vector>

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "glog/logging.h"
#include "sandbox/watchdog.hpp"
#include "util/file.hpp"

namespace {
const constexpr size_t kMaxSampledProcesses = 4096;

char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

// Resident set size of the process, from the second field of statm.
int GetProcessMemoryUsage(pid_t pid, int64_t* memory_usage_kb) {
  std::string statm;
  try {
    statm = util::File::Read(absl::StrCat("/proc/", pid, "/statm"), 1024);
  } catch (const std::system_error&) {
    return -1;
  }
  std::vector<std::string> fields =
      absl::StrSplit(statm, ' ', absl::SkipEmpty());
  int64_t pages = 0;
  if (fields.size() < 2 || !absl::SimpleAtoi(fields[1], &pages)) return -1;
  *memory_usage_kb = pages * (sysconf(_SC_PAGESIZE) / 1024);
  return 0;
}

// Children of the main thread of pid. Processes that exited in the meantime
// have no children.
std::vector<pid_t> GetChildren(pid_t pid) {
  std::string children;
  try {
    children = util::File::Read(
        absl::StrCat("/proc/", pid, "/task/", pid, "/children"), 64 * 1024);
  } catch (const std::system_error&) {
    return {};
  }
  std::vector<pid_t> result;
  for (absl::string_view field :
       absl::StrSplit(children, ' ', absl::SkipWhitespace())) {
    pid_t child = 0;
    if (absl::SimpleAtoi(field, &child)) result.push_back(child);
  }
  return result;
}

// Sum of the resident set sizes of the processes in the tree rooted at pid,
// skipping the first skip_levels levels.
int64_t GetTreeMemoryUsage(pid_t pid, int skip_levels) {
  int64_t total_kb = 0;
  std::vector<std::pair<pid_t, int>> pending = {{pid, 0}};
  size_t visited = 0;
  while (!pending.empty() && visited++ < kMaxSampledProcesses) {
    pid_t current = pending.back().first;
    int level = pending.back().second;
    pending.pop_back();
    int64_t memory_kb = 0;
    if (level >= skip_levels && GetProcessMemoryUsage(current, &memory_kb) == 0)
      total_kb += memory_kb;
    for (pid_t child : GetChildren(current))
      pending.emplace_back(child, level + 1);
  }
  return total_kb;
}

int64_t ToMillis(const struct timeval& tv) {
  return static_cast<int64_t>(tv.tv_sec) * 1000 + tv.tv_usec / 1000;
}

std::vector<char> ToCString(const std::string& s) {
  std::vector<char> v(s.begin(), s.end());
  v.push_back(0);
  return v;
}

const constexpr auto kMemoryPollInterval = std::chrono::milliseconds(5);
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;

bool Unix::Execute(const ExecutionOptions& options, ExecutionInfo* info,
                   std::string* error_msg) {
  options_ = &options;
  bool ok = Setup(error_msg) && DoFork(error_msg) && Wait(info, error_msg);
  cgroup_.reset();
  options_ = nullptr;
  return ok;
}

void Unix::ClosePipe() {
  for (int& fd : pipe_fds_) {
    if (fd != -1) close(fd);
    fd = -1;
  }
}

bool Unix::Setup(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  arg_storage_.clear();
  env_storage_.clear();
  argv_.clear();
  envp_.clear();
  arg_storage_.push_back(ToCString(options_->executable));
  for (const std::string& arg : options_->args)
    arg_storage_.push_back(ToCString(arg));
  for (std::vector<char>& arg : arg_storage_) argv_.push_back(arg.data());
  argv_.push_back(nullptr);
  for (const std::string& var : options_->env)
    env_storage_.push_back(ToCString(var));
  for (std::vector<char>& var : env_storage_) envp_.push_back(var.data());
  envp_.push_back(nullptr);

  if (!options_->cgroup_root.empty()) {
    cgroup_ = Cgroup::Create(options_->cgroup_root, error_msg);
    if (!cgroup_) return false;
    if (!cgroup_->Configure(options_->memory_limit_kb, options_->max_procs,
                            options_->cpu_share_percent, error_msg))
      return false;
    VLOG(1) << "Using cgroup " << cgroup_->Path();
  }

  if (pipe2(pipe_fds_, O_CLOEXEC) == -1) {
    *error_msg = "pipe2: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  if (!OnSetup(error_msg)) {
    ClosePipe();
    return false;
  }
  return true;
}

bool Unix::DoFork(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  start_ = std::chrono::steady_clock::now();
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    ClosePipe();
    return false;
  }
  if (fork_result == 0) Child();
  child_pid_ = fork_result;
  VLOG(1) << "Started " << options_->executable << " as pid " << child_pid_;
  return true;
}

void Unix::Child() {
  close(pipe_fds_[0]);
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 2] = {};
    strncat(buf, prefix, 64);
    strncat(buf, ": ", 2);
    strncat(buf, err, kStrErrorBufSize);
    int len = strlen(buf);
    if (write(pipe_fds_[1], &len, sizeof(len)) == sizeof(len))
      if (write(pipe_fds_[1], buf, len) < 0) _Exit(1);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));
  };

  // New session: the process group id is the child pid, so the whole tree
  // can be killed at once.
  if (setsid() == -1) die("setsid", errno);

  if (cgroup_) {
    int procs_fd = open(cgroup_->ProcsFile().c_str(), O_WRONLY | O_CLOEXEC);
    if (procs_fd == -1) die("open cgroup.procs", errno);
    if (write(procs_fd, "0", 1) != 1) die("join cgroup", errno);
    close(procs_fd);
  }

  const char* stdin_file = options_->stdin_file.empty()
                               ? "/dev/null"
                               : options_->stdin_file.c_str();
  int stdin_fd = open(stdin_file, O_RDONLY | O_CLOEXEC);
  if (stdin_fd == -1) die("open", errno);
  int stdout_fd = -1;
  int stderr_fd = -1;
  if (!options_->stdout_file.empty()) {
    stdout_fd = open(options_->stdout_file.c_str(),
                     O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                     S_IRUSR | S_IWUSR);
    if (stdout_fd == -1) die("creat", errno);
  }
  if (!options_->stderr_file.empty()) {
    stderr_fd = open(options_->stderr_file.c_str(),
                     O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                     S_IRUSR | S_IWUSR);
    if (stderr_fd == -1) die("creat", errno);
  }

  char buf[kStrErrorBufSize] = {};
  if (!OnChild(buf, kStrErrorBufSize)) {
    die2("OnChild", buf);
  }

  if (chdir(options_->root.c_str()) == -1) {
    die("chdir", errno);
  }

  // Handle I/O redirection.
#define DUP(field, fd)                          \
  if (field##_fd != -1) {                       \
    int ret = dup2(field##_fd, fd);             \
    if (ret == -1) die("redir " #field, errno); \
  }
  DUP(stdin, STDIN_FILENO);
  DUP(stdout, STDOUT_FILENO);
  DUP(stderr, STDERR_FILENO);
#undef DUP

  // Set resource limits.
  struct rlimit rlim;
#define SET_RLIM(res, cur, max)                 \
  {                                             \
    rlim.rlim_cur = cur;                        \
    rlim.rlim_max = max;                        \
    if (setrlimit(RLIMIT_##res, &rlim) < 0) {   \
      die("setrlim " #res, errno);              \
    }                                           \
  }
#define SET_RLIM_IF(res, value) \
  {                             \
    rlim_t lim = value;         \
    if (lim) SET_RLIM(res, lim, lim); \
  }

  if (options_->limit_address_space)
    SET_RLIM_IF(AS, options_->memory_limit_kb * 1024);
  if (options_->cpu_limit_millis) {
    // SIGXCPU at the soft limit, SIGKILL one second later.
    rlim_t seconds = (options_->cpu_limit_millis + 999) / 1000;
    SET_RLIM(CPU, seconds, seconds + 1);
  }
  SET_RLIM_IF(FSIZE, options_->max_file_size_kb * 1024);
  SET_RLIM_IF(NOFILE, options_->max_files);
  SET_RLIM(CORE, 0, 0);
  SET_RLIM(STACK,
           options_->max_stack_kb ? options_->max_stack_kb * 1024
                                  : RLIM_INFINITY,
           options_->max_stack_kb ? options_->max_stack_kb * 1024
                                  : RLIM_INFINITY);
#undef SET_RLIM_IF
#undef SET_RLIM

  if (options_->nice) {
    errno = 0;
    if (nice(options_->nice) == -1 && errno != 0) die("nice", errno);
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

int64_t Unix::SampleMemoryKb() const {
  int64_t memory_kb = GetTreeMemoryUsage(child_pid_, SupervisorDepth());
  if (cgroup_) memory_kb = std::max(memory_kb, cgroup_->MemoryCurrentKb());
  return memory_kb;
}

bool Unix::Wait(ExecutionInfo* info, std::string* error_msg) {
  close(pipe_fds_[1]);
  pipe_fds_[1] = -1;
  int error_len = 0;
  if (read(pipe_fds_[0], &error_len, sizeof(error_len)) == sizeof(error_len)) {
    char error[PIPE_BUF + 1] = {};
    if (error_len > PIPE_BUF) error_len = PIPE_BUF;
    if (read(pipe_fds_[0], error, error_len) < 0) error[0] = 0;
    *error_msg = error;
    ClosePipe();
    waitpid(child_pid_, nullptr, 0);
    child_pid_ = 0;
    return false;
  }
  ClosePipe();

  Watchdog watchdog(child_pid_,
                    std::chrono::milliseconds(options_->wall_limit_millis));
  std::atomic<bool> done{false};
  std::atomic<bool> memory_exceeded{false};
  std::atomic<int64_t> memory_usage{0};
  std::thread memory_watcher([this, &done, &memory_exceeded, &memory_usage] {
    while (!done) {
      int64_t mem = SampleMemoryKb();
      if (mem > memory_usage) memory_usage = mem;
      bool oom = cgroup_ && cgroup_->OomKills() > 0;
      if (oom || (options_->memory_limit_kb &&
                  mem > options_->memory_limit_kb)) {
        VLOG(1) << "Memory limit exceeded by pid " << child_pid_;
        memory_exceeded = true;
        kill(-child_pid_, SIGKILL);
        break;
      }
      std::this_thread::sleep_for(kMemoryPollInterval);
    }
  });

  // The child stays a zombie until wait4 below, so its pid (and process group
  // id) cannot be reused while the watchers may still send signals.
  siginfo_t siginfo{};
  int ret;
  do {
    ret = waitid(P_PID, child_pid_, &siginfo, WEXITED | WNOWAIT);
  } while (ret == -1 && errno == EINTR);
  int wait_errno = errno;
  done = true;
  watchdog.Disarm();
  memory_watcher.join();
  info->wall_time_millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                               std::chrono::steady_clock::now() - start_)
                               .count();

  // Descendants that outlived the main process.
  if (kill(-child_pid_, SIGKILL) == -1 && errno != ESRCH)
    PLOG(WARNING) << "kill process group " << child_pid_;
  if (cgroup_) cgroup_->KillAll();

  int child_status = 0;
  struct rusage rusage {};
  if (ret == -1 || wait4(child_pid_, &child_status, 0, &rusage) != child_pid_) {
    char buf[kStrErrorBufSize] = {};
    *error_msg = "wait: ";
    *error_msg += mystrerror(ret == -1 ? wait_errno : errno, buf,
                             kStrErrorBufSize);
    child_pid_ = 0;
    return false;
  }
  child_pid_ = 0;

  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  info->cpu_time_millis = ToMillis(rusage.ru_utime);
  info->sys_time_millis = ToMillis(rusage.ru_stime);
  // ru_maxrss is the peak of the largest descendant, in KiB on Linux.
  info->memory_usage_kb =
      std::max<int64_t>(memory_usage.load(), rusage.ru_maxrss);
  if (cgroup_) {
    info->memory_usage_kb =
        std::max(info->memory_usage_kb, cgroup_->MemoryPeakKb());
    if (cgroup_->OomKills() > 0) memory_exceeded = true;
  }
  info->killed_by_watchdog = watchdog.Fired();
  info->killed_for_memory = memory_exceeded;
  info->cpu_limit_exceeded =
      info->signal == SIGXCPU ||
      (options_->cpu_limit_millis && info->signal == SIGKILL &&
       info->cpu_time_millis + info->sys_time_millis >=
           options_->cpu_limit_millis);
  if (info->signal) {
    info->message = strsignal(info->signal);
  } else if (info->status_code) {
    info->message = absl::StrCat("Exited with status ", info->status_code);
  }
  VLOG(1) << "pid exited: status " << info->status_code << " signal "
          << info->signal << " wall " << info->wall_time_millis << "ms mem "
          << info->memory_usage_kb << "KiB";

  OnFinish(info);
  return true;
}

void Unix::Terminate() {
  if (child_pid_ <= 0) return;
  kill(-child_pid_, SIGKILL);
  if (waitpid(child_pid_, nullptr, 0) == -1)
    PLOG(WARNING) << "waitpid " << child_pid_;
  child_pid_ = 0;
}

Unix::~Unix() {
  Terminate();
  ClosePipe();
}

namespace {
Sandbox::Register<Unix> r;
}  // namespace

}  // namespace sandbox
