#include "sandbox/namespaced.hpp"

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <sched.h>
#include <signal.h>
#include <stdio.h>
#include <string.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/wait.h>
#include <unistd.h>

#include "absl/strings/match.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "glog/logging.h"
#include "util/file.hpp"

namespace {

const constexpr int kNamespaces = CLONE_NEWUSER | CLONE_NEWNS | CLONE_NEWPID |
                                  CLONE_NEWNET | CLONE_NEWIPC | CLONE_NEWUTS;

std::vector<char> ToCString(const std::string& s) {
  std::vector<char> v(s.begin(), s.end());
  v.push_back(0);
  return v;
}

std::string Absolute(const std::string& path) {
  if (!path.empty() && path[0] == '/') return path;
  char cwd[PATH_MAX] = {};
  if (getcwd(cwd, sizeof(cwd)) == nullptr) return path;
  return util::File::JoinPath(cwd, path);
}

// Wait status of pid, or -1.
int WaitFor(pid_t pid) {
  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) return -1;
  }
  return status;
}

// Terminates the calling process with the same wait status.
[[noreturn]] void ExitLike(int status) {
  if (status != -1 && WIFSIGNALED(status)) {
    int sig = WTERMSIG(status);
    struct rlimit no_core = {0, 0};
    setrlimit(RLIMIT_CORE, &no_core);
    signal(sig, SIG_DFL);
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, sig);
    sigprocmask(SIG_UNBLOCK, &set, nullptr);
    raise(sig);
    _exit(128 + sig);
  }
  _exit(status != -1 && WIFEXITED(status) ? WEXITSTATUS(status) : 1);
}

// Decodes the octal escapes (\040 and similar) of /proc/self/mountinfo.
std::string Unescape(absl::string_view s) {
  std::string out;
  for (size_t i = 0; i < s.size(); i++) {
    if (s[i] == '\\' && i + 3 < s.size() && s[i + 1] >= '0' &&
        s[i + 1] <= '7') {
      out.push_back(static_cast<char>((s[i + 1] - '0') * 64 +
                                      (s[i + 2] - '0') * 8 + (s[i + 3] - '0')));
      i += 3;
    } else {
      out.push_back(s[i]);
    }
  }
  return out;
}

// Flags that a remount inside a user namespace must keep.
unsigned long LockedFlags(const std::string& path) {
  struct statvfs st {};
  if (statvfs(path.c_str(), &st) == -1) return 0;
  unsigned long flags = 0;
  if (st.f_flag & ST_NOSUID) flags |= MS_NOSUID;
  if (st.f_flag & ST_NODEV) flags |= MS_NODEV;
  if (st.f_flag & ST_NOEXEC) flags |= MS_NOEXEC;
  if (st.f_flag & ST_NOATIME) flags |= MS_NOATIME;
  if (st.f_flag & ST_NODIRATIME) flags |= MS_NODIRATIME;
  if (st.f_flag & ST_RELATIME) flags |= MS_RELATIME;
  return flags;
}

bool IsPseudoFilesystem(const std::string& path) {
  for (const char* prefix : {"/proc", "/sys", "/dev"}) {
    if (path == prefix || absl::StartsWith(path, std::string(prefix) + "/"))
      return true;
  }
  return false;
}

bool WriteProcFile(const char* path, const char* contents) {
  int fd = open(path, O_WRONLY | O_CLOEXEC);
  if (fd == -1) return false;
  size_t len = strlen(contents);
  bool ok = write(fd, contents, len) == static_cast<ssize_t>(len);
  close(fd);
  return ok;
}

bool Fail(char* error_msg, size_t buflen, const char* what, int err) {
  char buf[256] = {};
  strncpy(error_msg, what, buflen - 1);
  strncat(error_msg, ": ", buflen - strlen(error_msg) - 1);
  strncat(error_msg, strerror_r(err, buf, sizeof(buf)),
          buflen - strlen(error_msg) - 1);
  return false;
}

}  // namespace

namespace sandbox {

int Namespaced::Score() {
  char uid_map[64] = {};
  char gid_map[64] = {};
  snprintf(uid_map, sizeof(uid_map), "%d %d 1\n", getuid(), getuid());
  snprintf(gid_map, sizeof(gid_map), "%d %d 1\n", getgid(), getgid());
  unsigned long root_flags = LockedFlags("/");
  int pid = fork();
  if (pid == -1) return -1;
  if (pid == 0) {
    // Same steps as OnChild, on the root mount only.
    if (unshare(kNamespaces) == -1) _Exit(1);
    if (!WriteProcFile("/proc/self/setgroups", "deny") && errno != ENOENT)
      _Exit(1);
    if (!WriteProcFile("/proc/self/uid_map", uid_map)) _Exit(1);
    if (!WriteProcFile("/proc/self/gid_map", gid_map)) _Exit(1);
    if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) == -1)
      _Exit(1);
    if (mount(nullptr, "/", nullptr,
              MS_REMOUNT | MS_BIND | MS_RDONLY | root_flags,
              nullptr) == -1)
      _Exit(1);
    if (mount("tmpfs", "/tmp", "tmpfs", MS_NOSUID | MS_NODEV, "size=16k") ==
            -1 &&
        errno != ENOENT)
      _Exit(1);
    int init = fork();
    if (init == -1) _Exit(1);
    if (init == 0) _Exit(getpid() == 1 ? 0 : 1);
    _Exit(WaitFor(init) == 0 ? 0 : 1);
  }
  int status = WaitFor(pid);
  if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    LOG(WARNING) << "User namespaces are not available";
    return -1;
  }
  return 3;
}

bool Namespaced::OnSetup(std::string* error_msg) {
  snprintf(uid_map_, sizeof(uid_map_), "%d %d 1\n", getuid(), getuid());
  snprintf(gid_map_, sizeof(gid_map_), "%d %d 1\n", getgid(), getgid());
  std::string mountinfo;
  try {
    mountinfo = util::File::Read("/proc/self/mountinfo", 1 << 20);
  } catch (const std::system_error& e) {
    *error_msg = e.what();
    return false;
  }
  mounts_.clear();
  for (absl::string_view line :
       absl::StrSplit(mountinfo, '\n', absl::SkipEmpty())) {
    std::vector<absl::string_view> fields = absl::StrSplit(line, ' ');
    if (fields.size() < 5) continue;
    std::string path = Unescape(fields[4]);
    MountPoint mount;
    mount.path = ToCString(path);
    mount.flags = LockedFlags(path);
    mount.required = !IsPseudoFilesystem(path);
    mounts_.push_back(std::move(mount));
  }
  VLOG(1) << "Remounting " << mounts_.size() << " mounts read-only";

  std::string root = Absolute(options_->root);
  root_ = ToCString(root);
  hidden_dir_.clear();
  hidden_path_.clear();
  if (!options_->hidden_dir.empty()) {
    std::string hidden = Absolute(options_->hidden_dir);
    while (hidden.size() > 1 && hidden.back() == '/') hidden.pop_back();
    if (hidden == "/" || !absl::StartsWith(root, hidden + "/")) {
      *error_msg = "Sandbox root " + root + " is not inside " + hidden;
      return false;
    }
    hidden_dir_ = ToCString(hidden);
    for (size_t pos = hidden.size() + 1; pos <= root.size(); pos++) {
      if (pos == root.size() || root[pos] == '/')
        hidden_path_.push_back(ToCString(root.substr(0, pos)));
    }
  }
  return true;
}

bool Namespaced::SetupMounts(char* error_msg, size_t buflen) {
  if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) == -1)
    return Fail(error_msg, buflen, "mount private", errno);
  const char* root = root_.data();
  int root_fd = -1;
  if (hidden_dir_.empty()) {
    if (mount(root, root, nullptr, MS_BIND | MS_REC, nullptr) == -1)
      return Fail(error_msg, buflen, "bind root", errno);
  } else {
    // Keeps the root reachable once the hidden directory is covered.
    root_fd = open(root, O_PATH | O_DIRECTORY | O_CLOEXEC);
    if (root_fd == -1) return Fail(error_msg, buflen, "open root", errno);
  }
  for (const MountPoint& m : mounts_) {
    if (mount(nullptr, m.path.data(), nullptr,
              MS_REMOUNT | MS_BIND | MS_RDONLY | m.flags, nullptr) == -1) {
      if (errno == ENOENT || !m.required) continue;
      return Fail(error_msg, buflen, m.path.data(), errno);
    }
  }
  if (root_fd == -1) return true;

  const char* hidden = hidden_dir_.data();
  if (mount("tmpfs", hidden, "tmpfs", MS_NOSUID | MS_NODEV,
            "size=16k,mode=755") == -1)
    return Fail(error_msg, buflen, "mount tmpfs", errno);
  for (const std::vector<char>& dir : hidden_path_) {
    if (mkdir(dir.data(), 0755) == -1 && errno != EEXIST)
      return Fail(error_msg, buflen, "mkdir", errno);
  }
  char root_source[64] = {};
  snprintf(root_source, sizeof(root_source), "/proc/self/fd/%d", root_fd);
  if (mount(root_source, root, nullptr, MS_BIND | MS_REC, nullptr) == -1)
    return Fail(error_msg, buflen, "bind root", errno);
  close(root_fd);
  if (mount(nullptr, hidden, nullptr,
            MS_REMOUNT | MS_BIND | MS_RDONLY | MS_NOSUID | MS_NODEV,
            nullptr) == -1)
    return Fail(error_msg, buflen, "remount tmpfs", errno);
  return true;
}

bool Namespaced::OnChild(char* error_msg, size_t buflen) {
  if (prctl(PR_SET_PDEATHSIG, SIGKILL, 0, 0, 0) == -1)
    return Fail(error_msg, buflen, "prctl", errno);
  if (unshare(kNamespaces) == -1)
    return Fail(error_msg, buflen, "unshare", errno);
  if (!WriteProcFile("/proc/self/setgroups", "deny") && errno != ENOENT)
    return Fail(error_msg, buflen, "setgroups", errno);
  if (!WriteProcFile("/proc/self/uid_map", uid_map_))
    return Fail(error_msg, buflen, "uid_map", errno);
  if (!WriteProcFile("/proc/self/gid_map", gid_map_))
    return Fail(error_msg, buflen, "gid_map", errno);
  if (!SetupMounts(error_msg, buflen)) return false;

  int status_fds[2];
  if (pipe2(status_fds, O_CLOEXEC) == -1)
    return Fail(error_msg, buflen, "pipe2", errno);
  int init = fork();
  if (init == -1) return Fail(error_msg, buflen, "fork", errno);
  if (init == 0) {
    close(status_fds[0]);
    return RunInit(status_fds[1], error_msg, buflen);
  }

  // Keeper. Closing the error pipe lets the parent see the exec of the
  // program, which holds the last copy of it.
  close(pipe_fds_[1]);
  close(status_fds[1]);
  int init_status = WaitFor(init);
  int status = 0;
  if (read(status_fds[0], &status, sizeof(status)) != sizeof(status))
    status = init_status;
  ExitLike(status);
}

bool Namespaced::RunInit(int status_fd, char* error_msg, size_t buflen) {
  if (prctl(PR_SET_PDEATHSIG, SIGKILL, 0, 0, 0) == -1)
    return Fail(error_msg, buflen, "prctl", errno);
  // Only the processes of this namespace are listed. Mounting proc is denied
  // when the outer one is partially covered, and then the outer one stays.
  if (mount("proc", "/proc", "proc",
            MS_NOSUID | MS_NODEV | MS_NOEXEC | MS_RDONLY, nullptr) == -1 &&
      errno != EPERM)
    return Fail(error_msg, buflen, "mount proc", errno);
  int program = fork();
  if (program == -1) return Fail(error_msg, buflen, "fork", errno);
  if (program == 0) {
    close(status_fd);
    return true;
  }
  close(pipe_fds_[1]);
  int status = WaitFor(program);
  if (status != -1 &&
      write(status_fd, &status, sizeof(status)) != sizeof(status))
    _exit(1);
  // Every other process of the namespace is killed when init exits.
  _exit(0);
}

namespace {
Sandbox::Register<Namespaced> r;
}  // namespace

}  // namespace sandbox
