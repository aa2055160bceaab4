#include "executor/local_executor.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <system_error>

#include "executor/hints.hpp"
#include "executor/sandbox_lease.hpp"
#include "glog/logging.h"
#include "google/protobuf/util/time_util.h"
#include "language/pipeline.hpp"

namespace executor {

namespace {

void SystemError(const std::string& error, proto::ExecutionResponse* response) {
  response->set_success(false);
  response->set_status(proto::SYSTEM_ERROR);
  response->clear_output();
  response->clear_compilation_error();
  response->set_error(error);
  response->set_execution_time_ms(0);
  response->set_memory_usage_mb(0);
}

const std::string& ErrorText(const proto::ExecutionResponse& response) {
  if (response.has_compilation_error()) return response.compilation_error();
  return response.error();
}

}  // namespace

LocalExecutor::LocalExecutor(ExecutorOptions options)
    : options_(std::move(options)),
      validator_(options_.default_timeout_seconds,
                 options_.max_timeout_seconds),
      scanner_(policy::SecurityScanner::Default()),
      slots_(std::max(options_.max_parallel, 0)),
      status_(options_.temp_directory, options_.sandbox,
              options_.execution_enabled) {
  proto::HealthResponse health = status_.Probe();
  LOG(INFO) << "Executor started with " << slots_.Capacity()
            << " slots, health " << health.status() << ": "
            << health.message();
}

proto::ExecutionResponse LocalExecutor::Execute(
    const proto::ExecutionRequest& request) {
  try {
    validator_.Validate(request);
  } catch (const policy::ValidationError& e) {
    LOG(WARNING) << "Invalid request: " << e.what();
    throw;
  }
  const language::LanguageProfile& profile =
      language::LanguageProfile::For(request.language());
  int32_t timeout_seconds = validator_.EffectiveTimeout(request);
  Classifier classifier(profile, timeout_seconds,
                        options_.compile_timeout_seconds);

  proto::ExecutionResponse response;
  *response.mutable_executed_at() =
      google::protobuf::util::TimeUtil::GetCurrentTime();
  response.set_language(profile.Name());
  LOG(INFO) << "Executing " << profile.Name() << " code ("
            << request.code().size() << " bytes, timeout " << timeout_seconds
            << "s)";

  absl::optional<proto::SecurityFinding> finding =
      scanner_.Check(request.code(), request.language());
  if (finding) {
    LOG(WARNING) << "Rejected " << profile.Name() << " code: "
                 << finding->description() << " at line " << finding->line();
    classifier.Rejected(*finding, &response);
  } else {
    RunInSandbox(profile, classifier, request, timeout_seconds, &response);
  }
  response.set_hint(
      executor::Hint(response.status(), ErrorText(response), request.language()));
  CHECK(HasSingleBody(response))
      << "Inconsistent response: " << response.ShortDebugString();

  LOG(INFO) << "Executed " << profile.Name() << " code: "
            << proto::ExecutionStatus_Name(response.status()) << " in "
            << response.execution_time_ms() << "ms, "
            << response.memory_usage_mb() << "MB";
  return response;
}

void LocalExecutor::RunInSandbox(const language::LanguageProfile& profile,
                                 const Classifier& classifier,
                                 const proto::ExecutionRequest& request,
                                 int32_t timeout_seconds,
                                 proto::ExecutionResponse* response) {
  if (!options_.execution_enabled) {
    SystemError("Code execution is disabled", response);
    return;
  }
  if (!status_.Available()) {
    LOG(ERROR) << "Refusing to execute: " << status_.Reason();
    SystemError("Sandbox runtime unavailable: " + status_.Reason(), response);
    return;
  }

  language::StepLimits limits;
  limits.run_wall_millis =
      int64_t{timeout_seconds} * 1000 + options_.watchdog_grace_millis;
  limits.build_wall_millis = int64_t{options_.compile_timeout_seconds} * 1000;
  limits.memory_limit_mb = std::min<int64_t>(profile.DefaultMemoryMb(),
                                             options_.memory_limit_mb);
  limits.max_output_kb = options_.max_output_kb;
  limits.cgroup_root = options_.cgroup_root;

  try {
    SandboxLease lease(&slots_,
                       std::chrono::milliseconds(options_.slot_wait_millis),
                       options_.temp_directory, options_.sandbox);
    language::Outcome outcome;
    std::string error_msg;
    if (!language::Pipeline(profile, limits)
             .Run(lease.Sandbox(), lease.ScratchDir(), request.code(),
                  request.input(), &outcome, &error_msg)) {
      LOG(ERROR) << "Sandbox failure: " << error_msg;
      SystemError("Sandbox failure: " + error_msg, response);
      return;
    }
    classifier.Classify(outcome, response);
  } catch (const no_slot_available& e) {
    LOG(WARNING) << e.what();
    SystemError(e.what(), response);
  } catch (const sandbox_unavailable& e) {
    status_.MarkUnavailable(e.what());
    SystemError(std::string("Sandbox runtime unavailable: ") + e.what(),
                response);
  } catch (const std::system_error& e) {
    LOG(ERROR) << "Scratch I/O failure: " << e.what();
    SystemError(std::string("Scratch I/O failure: ") + e.what(), response);
  } catch (const std::runtime_error& e) {
    LOG(ERROR) << "Execution failed: " << e.what();
    SystemError(e.what(), response);
  }
}

proto::ValidationResponse LocalExecutor::Validate(
    const proto::ExecutionRequest& request) {
  proto::ValidationResponse response;
  try {
    validator_.Validate(request);
  } catch (const policy::ValidationError& e) {
    response.set_valid(false);
    response.set_message(e.what());
    return response;
  }
  for (proto::SecurityFinding& finding :
       scanner_.Scan(request.code(), request.language()))
    *response.add_findings() = std::move(finding);
  absl::optional<proto::SecurityFinding> finding =
      scanner_.Check(request.code(), request.language());
  response.set_valid(!finding);
  response.set_message(finding ? policy::DescribeFinding(*finding)
                               : "Code is valid");
  return response;
}

proto::HintResponse LocalExecutor::Hint(
    const proto::ExecutionRequest& request) {
  proto::ExecutionResponse execution = Execute(request);
  proto::HintResponse response;
  response.set_status(execution.status());
  response.set_hint(execution.hint());
  return response;
}

proto::HealthResponse LocalExecutor::Health() { return status_.Probe(); }

proto::LanguagesResponse LocalExecutor::Languages() {
  proto::LanguagesResponse response;
  for (const language::LanguageProfile* profile :
       language::LanguageProfile::All()) {
    proto::LanguageInfo* info = response.add_language();
    info->set_language(profile->Language());
    info->set_name(profile->Name());
    info->set_compiled(profile->IsCompiled());
    info->set_available(profile->Available());
  }
  return response;
}

}  // namespace executor
