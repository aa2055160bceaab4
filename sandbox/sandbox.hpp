#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sandbox {

// Settings to execute the program in the sandbox.
struct ExecutionOptions {
  // Optional values
  int64_t cpu_limit_millis = 0;
  int64_t wall_limit_millis = 0;
  int64_t memory_limit_kb = 0;
  int32_t max_procs = 0;
  int32_t max_files = 0;
  int64_t max_file_size_kb = 0;
  int64_t max_stack_kb = 0;
  // Niceness increment of the child; the CPU share when no cgroup is used.
  int32_t nice = 0;
  // Percentage of one CPU the child may use. Only enforced with a cgroup.
  int32_t cpu_share_percent = 0;
  // If false, memory_limit_kb is enforced only by the memory watcher and not
  // with RLIMIT_AS (runtimes that reserve huge virtual areas, like the JVM).
  bool limit_address_space = true;

  std::string stdin_file;
  std::string stdout_file;
  std::string stderr_file;
  std::vector<std::string> args;
  // Full environment of the child, as NAME=value strings.
  std::vector<std::string> env;
  // If not empty, each execution gets its own child cgroup in this directory.
  std::string cgroup_root;
  // Directory that sandboxes with filesystem isolation replace with an empty,
  // read-only one, except for root that must be inside it and stays visible.
  std::string hidden_dir;

  // Required values
  // Working directory of the child. It is the only directory the child is
  // guaranteed to be able to write to.
  std::string root;
  std::string executable;
  ExecutionOptions(std::string root, std::string executable)
      : root(std::move(root)), executable(std::move(executable)) {}
};

// Results of the execution.
struct ExecutionInfo {
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  int64_t memory_usage_kb = 0;
  int32_t status_code = 0;
  int32_t signal = 0;
  // The watchdog killed the process group after wall_limit_millis.
  bool killed_by_watchdog = false;
  // The memory watcher (or the cgroup OOM killer) killed the process group.
  bool killed_for_memory = false;
  // The child was killed for exceeding cpu_limit_millis.
  bool cpu_limit_exceeded = false;
  std::string message;
};

// Sandbox interface. Implementations need to register themselves by creating a
// global object of type Sandbox::Register<SandboxImpl> and should define the
// Create, Score and Name static functions. Create should return a pointer to a
// newly allocated instance of the given implementation, while Score should
// return a value that defines how "good" that sandbox is: negative if the
// sandbox should not/cannot be used in the current configuration, positive
// otherwise (a bigger value means a better sandbox).
// Registering a sandbox is not thread-safe and should be done before any
// threads are created.
class Sandbox {
 public:
  using create_t = std::function<Sandbox*()>;
  using score_t = std::function<int()>;

  // Returns a new instance of the best usable sandbox, or nullptr if none is
  // usable.
  static std::unique_ptr<Sandbox> Create();
  // Returns a new instance of the named sandbox, or nullptr if it does not
  // exist or is not usable.
  static std::unique_ptr<Sandbox> Create(const std::string& name);
  // Names of the usable sandboxes, best first.
  static std::vector<std::string> Available();

  virtual std::string Name() const = 0;

  // True if the child cannot reach the network, cannot write outside of its
  // root, and cannot see other executions or the calling process.
  virtual bool Isolated() const { return false; }

  // Runs the specified command. Returns true if the program was started,
  // and sets fields in info. Otherwise, returns false and sets error_msg.
  // A sandbox instance runs a single command at a time.
  virtual bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) = 0;

  // Kills every process that the sandbox started and that is still running.
  virtual void Terminate() {}

  // Constructor and destructors
  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;

  template <typename T>
  class Register {
   public:
    Register() { Sandbox::Register_(T::Name_(), &T::Create, &T::Score); }
  };

 private:
  struct Entry {
    std::string name;
    create_t create;
    score_t score;
  };
  using store_t = std::vector<Entry>;
  static store_t* Boxes_();
  // Usable entries sorted by decreasing score. Scores are computed once.
  static const std::vector<const Entry*>& Ranked_();
  static void Register_(std::string name, create_t, score_t);
  template <typename T>
  friend class Register;
};

}  // namespace sandbox

#endif
