#ifndef EXECUTOR_EXECUTOR_HPP
#define EXECUTOR_EXECUTOR_HPP

#include <cstdint>
#include <string>

#include "proto/codebox.pb.h"

namespace executor {

struct ExecutorOptions {
  std::string temp_directory = "/tmp/codebox";
  // 0 means one per hardware thread.
  int32_t max_parallel = 0;
  int32_t slot_wait_millis = 2000;
  int32_t default_timeout_seconds = 10;
  int32_t max_timeout_seconds = 30;
  int32_t compile_timeout_seconds = 30;
  int32_t watchdog_grace_millis = 1000;
  int32_t memory_limit_mb = 256;
  int32_t max_output_kb = 1024;
  bool execution_enabled = true;
  std::string cgroup_root;
  // Empty means the best available backend.
  std::string sandbox;
};

// The code-execution engine. Implementations are safe to call from several
// threads at once.
class Executor {
 public:
  // A string that identifies this executor.
  virtual std::string Id() const = 0;

  // Builds and runs the code of the request. Throws policy::ValidationError
  // for malformed requests; every other failure is reported in the status of
  // the response.
  virtual proto::ExecutionResponse Execute(
      const proto::ExecutionRequest& request) = 0;

  // Validates and scans the request without running it.
  virtual proto::ValidationResponse Validate(
      const proto::ExecutionRequest& request) = 0;

  // Runs the request and returns only the status and its hint.
  virtual proto::HintResponse Hint(const proto::ExecutionRequest& request) = 0;

  // Probes the sandbox runtime and refreshes its availability.
  virtual proto::HealthResponse Health() = 0;

  virtual proto::LanguagesResponse Languages() = 0;

  Executor() = default;
  virtual ~Executor() = default;
  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;
  Executor(Executor&&) = delete;
  Executor& operator=(Executor&&) = delete;
};

}  // namespace executor

#endif
