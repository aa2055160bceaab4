#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "sandbox/cgroup.hpp"
#include "sandbox/sandbox.hpp"

namespace sandbox {

// Base class for sandboxes for UNIX-like systems. The child runs in its own
// session and process group, with resource limits, a clean environment and
// (if requested) its own cgroup.
class Unix : public Sandbox {
 public:
  std::string Name() const override { return Name_(); }
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) override;
  void Terminate() override;
  ~Unix() override;

  static Sandbox* Create() { return new Unix(); }
  static int Score() { return 2; }
  static std::string Name_() { return "unix"; }

 protected:
  Unix() = default;

  // Executed before creating the child process. Returns false and sets
  // error_msg if setup fails.
  bool Setup(std::string* error_msg);

  // Hook that is executed at the end of Setup.
  virtual bool OnSetup(std::string* error_msg) { return true; }

  // Creates a child process and saves its PID in child_pid_. The child process
  // should execute Child and must not return.
  virtual bool DoFork(std::string* error_msg);

  // Function that is executed in the child process.
  [[noreturn]] void Child();

  // Hook that is executed in the child after the standard files have been
  // opened and before changing directory to the sandbox root. Returns false
  // if something went wrong and exec should not be called. The error_msg
  // string must not be longer then buflen characters. This function must not
  // use dynamic memory allocation.
  virtual bool OnChild(char* error_msg, size_t buflen) { return true; }

  // Waits for the termination of the child, killing its process group if it
  // exceeds the provided wall time or memory limits.
  bool Wait(ExecutionInfo* info, std::string* error_msg);

  // Executed when the child program exits. May change the execution info with
  // "better" values, or perform clean up.
  virtual void OnFinish(ExecutionInfo* info) {}

  // Number of levels of the process tree rooted at child_pid_ made of
  // supervisor processes, whose memory is not charged to the program.
  virtual int SupervisorDepth() const { return 0; }

  int pipe_fds_[2] = {-1, -1};
  int child_pid_ = 0;
  const ExecutionOptions* options_ = nullptr;
  std::unique_ptr<Cgroup> cgroup_;

 private:
  // Memory usage of the child and its descendants right now, in KiB.
  int64_t SampleMemoryKb() const;
  void ClosePipe();

  // Built by Setup so that Child does not need to allocate.
  std::vector<std::vector<char>> arg_storage_;
  std::vector<std::vector<char>> env_storage_;
  std::vector<char*> argv_;
  std::vector<char*> envp_;
  std::chrono::steady_clock::time_point start_;
};

}  // namespace sandbox
#endif
