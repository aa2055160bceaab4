#include "sandbox/cgroup.hpp"

#include <fcntl.h>
#include <signal.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <chrono>
#include <thread>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "glog/logging.h"
#include "util/file.hpp"

namespace {

bool WriteControl(const std::string& file, const std::string& value,
                  std::string* error_msg) {
  int fd = open(file.c_str(), O_WRONLY | O_CLOEXEC);
  if (fd == -1 ||
      write(fd, value.c_str(), value.size()) !=
          static_cast<ssize_t>(value.size())) {
    *error_msg = absl::StrCat("write ", file, ": ", strerror(errno));
    if (fd != -1) close(fd);
    return false;
  }
  close(fd);
  return true;
}

std::string ReadControl(const std::string& file) {
  try {
    return util::File::Read(file, util::kChunkSize);
  } catch (const std::system_error& e) {
    VLOG(1) << e.what();
    return "";
  }
}

}  // namespace

namespace sandbox {

std::unique_ptr<Cgroup> Cgroup::Create(const std::string& root,
                                       std::string* error_msg) {
  std::string tmpl = util::File::JoinPath(root, "codebox_XXXXXX");
  std::vector<char> name(tmpl.begin(), tmpl.end());
  name.push_back(0);
  if (mkdtemp(name.data()) == nullptr) {
    *error_msg = absl::StrCat("cgroup mkdir in ", root, ": ", strerror(errno));
    return nullptr;
  }
  return std::unique_ptr<Cgroup>(new Cgroup(name.data()));
}

Cgroup::Cgroup(std::string path)
    : path_(std::move(path)),
      procs_file_(util::File::JoinPath(path_, "cgroup.procs")) {}

bool Cgroup::Configure(int64_t memory_limit_kb, int32_t max_procs,
                       int32_t cpu_share_percent, std::string* error_msg) {
  if (memory_limit_kb) {
    if (!WriteControl(util::File::JoinPath(path_, "memory.max"),
                      std::to_string(memory_limit_kb * 1024), error_msg))
      return false;
    // Swap would let the program exceed the limit without being killed.
    if (!WriteControl(util::File::JoinPath(path_, "memory.swap.max"), "0",
                      error_msg))
      VLOG(1) << *error_msg;
  }
  if (max_procs &&
      !WriteControl(util::File::JoinPath(path_, "pids.max"),
                    std::to_string(max_procs), error_msg))
    return false;
  if (cpu_share_percent > 0 &&
      !WriteControl(util::File::JoinPath(path_, "cpu.max"),
                    absl::StrCat(cpu_share_percent * 1000, " 100000"),
                    error_msg))
    return false;
  return true;
}

int64_t Cgroup::ReadValue(const std::string& file) const {
  int64_t value = 0;
  std::string contents = ReadControl(util::File::JoinPath(path_, file));
  if (!absl::SimpleAtoi(absl::StripAsciiWhitespace(contents), &value))
    return -1;
  return value;
}

int64_t Cgroup::MemoryCurrentKb() const {
  int64_t bytes = ReadValue("memory.current");
  return bytes < 0 ? bytes : bytes / 1024;
}

int64_t Cgroup::MemoryPeakKb() const {
  int64_t bytes = ReadValue("memory.peak");
  return bytes < 0 ? bytes : bytes / 1024;
}

int64_t Cgroup::OomKills() const {
  std::string events =
      ReadControl(util::File::JoinPath(path_, "memory.events"));
  for (absl::string_view line : absl::StrSplit(events, '\n')) {
    std::vector<absl::string_view> kv =
        absl::StrSplit(line, ' ', absl::SkipEmpty());
    int64_t value = 0;
    if (kv.size() == 2 && kv[0] == "oom_kill" &&
        absl::SimpleAtoi(kv[1], &value))
      return value;
  }
  return 0;
}

void Cgroup::KillAll() {
  std::string error_msg;
  // cgroup.kill exists since Linux 5.14.
  if (WriteControl(util::File::JoinPath(path_, "cgroup.kill"), "1",
                   &error_msg))
    return;
  std::string procs = ReadControl(procs_file_);
  for (absl::string_view line : absl::StrSplit(procs, '\n', absl::SkipEmpty())) {
    int pid = 0;
    if (absl::SimpleAtoi(line, &pid) && pid > 0) kill(pid, SIGKILL);
  }
}

Cgroup::~Cgroup() {
  KillAll();
  // Killed processes leave the cgroup asynchronously.
  for (int attempt = 0; attempt < 100; attempt++) {
    if (rmdir(path_.c_str()) == 0 || errno == ENOENT) return;
    if (errno != EBUSY) break;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  PLOG(WARNING) << "Unable to remove cgroup " << path_;
}

}  // namespace sandbox
