#ifndef EXECUTOR_LOCAL_EXECUTOR_HPP
#define EXECUTOR_LOCAL_EXECUTOR_HPP

#include <cstddef>
#include <string>

#include "executor/classifier.hpp"
#include "executor/executor.hpp"
#include "executor/runtime_status.hpp"
#include "executor/slot_pool.hpp"
#include "language/profile.hpp"
#include "policy/security_scanner.hpp"
#include "policy/validator.hpp"

namespace executor {

// Runs requests in sandboxes on this machine.
class LocalExecutor : public Executor {
 public:
  explicit LocalExecutor(ExecutorOptions options);
  ~LocalExecutor() override = default;

  std::string Id() const override { return "LOCAL"; }
  proto::ExecutionResponse Execute(
      const proto::ExecutionRequest& request) override;
  proto::ValidationResponse Validate(
      const proto::ExecutionRequest& request) override;
  proto::HintResponse Hint(const proto::ExecutionRequest& request) override;
  proto::HealthResponse Health() override;
  proto::LanguagesResponse Languages() override;

  // Number of slots currently held by running requests.
  size_t ActiveExecutions() const { return slots_.InUse(); }

  LocalExecutor(const LocalExecutor&) = delete;
  LocalExecutor& operator=(const LocalExecutor&) = delete;
  LocalExecutor(LocalExecutor&&) = delete;
  LocalExecutor& operator=(LocalExecutor&&) = delete;

 private:
  void RunInSandbox(const language::LanguageProfile& profile,
                    const Classifier& classifier,
                    const proto::ExecutionRequest& request,
                    int32_t timeout_seconds,
                    proto::ExecutionResponse* response);

  const ExecutorOptions options_;
  const policy::Validator validator_;
  const policy::SecurityScanner& scanner_;
  SlotPool slots_;
  RuntimeStatus status_;
};

}  // namespace executor

#endif
