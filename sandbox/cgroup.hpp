#ifndef SANDBOX_CGROUP_HPP
#define SANDBOX_CGROUP_HPP

#include <cstdint>
#include <memory>
#include <string>

namespace sandbox {

// A child cgroup (cgroup v2) holding the processes of a single execution.
// The parent directory must be delegated to the current user, with the
// memory, pids and cpu controllers enabled in its cgroup.subtree_control.
class Cgroup {
 public:
  // Creates a new, uniquely named cgroup below root. Returns nullptr and sets
  // error_msg on failure.
  static std::unique_ptr<Cgroup> Create(const std::string& root,
                                        std::string* error_msg);

  // Writes the limits. A zero value leaves the corresponding limit unset.
  bool Configure(int64_t memory_limit_kb, int32_t max_procs,
                 int32_t cpu_share_percent, std::string* error_msg);

  // File the child writes "0" to in order to join the cgroup.
  const std::string& ProcsFile() const { return procs_file_; }
  const std::string& Path() const { return path_; }

  // Current and peak memory usage, or -1 if unavailable.
  int64_t MemoryCurrentKb() const;
  int64_t MemoryPeakKb() const;
  // Number of processes the kernel OOM killer killed in this cgroup.
  int64_t OomKills() const;

  // Kills every process in the cgroup.
  void KillAll();

  // Kills remaining processes and removes the cgroup.
  ~Cgroup();

  Cgroup(const Cgroup&) = delete;
  Cgroup& operator=(const Cgroup&) = delete;

 private:
  explicit Cgroup(std::string path);
  int64_t ReadValue(const std::string& file) const;

  std::string path_;
  std::string procs_file_;
};

}  // namespace sandbox

#endif
