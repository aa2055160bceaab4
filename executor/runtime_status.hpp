#ifndef EXECUTOR_RUNTIME_STATUS_HPP
#define EXECUTOR_RUNTIME_STATUS_HPP

#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "proto/codebox.pb.h"

namespace executor {

// Whether sandboxed execution can currently be used. The state is owned by
// the executor, checked on every request, marked unavailable on
// infrastructure failures and refreshed by Probe.
class RuntimeStatus {
 public:
  RuntimeStatus(std::string temp_directory, std::string sandbox_name,
                bool execution_enabled)
      : temp_directory_(std::move(temp_directory)),
        sandbox_name_(std::move(sandbox_name)),
        execution_enabled_(execution_enabled) {}

  bool ExecutionEnabled() const { return execution_enabled_; }
  bool Available() const;
  // Why the runtime is unavailable, or an empty string.
  std::string Reason() const;
  void MarkUnavailable(const std::string& reason);

  // Checks that a sandbox can be created, that the scratch root is writable
  // and which toolchains are installed, then updates the state. The status is
  // DEGRADED when the best backend is not isolated and none was named.
  proto::HealthResponse Probe();

 private:
  const std::string temp_directory_;
  const std::string sandbox_name_;
  const bool execution_enabled_;

  mutable absl::Mutex mutex_;
  bool available_ GUARDED_BY(mutex_) = false;
  std::string reason_ GUARDED_BY(mutex_) = "Not probed yet";
};

}  // namespace executor

#endif
