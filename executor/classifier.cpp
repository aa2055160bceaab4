#include "executor/classifier.hpp"

#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "policy/security_scanner.hpp"

namespace executor {

namespace {

int64_t RoundUpMb(int64_t kb) { return (kb + 1023) / 1024; }

void SetMeasures(const language::StepResult& step,
                 proto::ExecutionResponse* response) {
  response->set_execution_time_ms(step.info.wall_time_millis);
  response->set_memory_usage_mb(RoundUpMb(step.info.memory_usage_kb));
}

std::string MemoryLimitMessage(const language::StepResult& step) {
  return absl::StrCat("Memory limit of ", step.memory_limit_kb / 1024,
                      " MB exceeded");
}

bool Failed(const sandbox::ExecutionInfo& info) {
  return info.status_code != 0 || info.signal != 0;
}

}  // namespace

std::string DescribeTermination(const sandbox::ExecutionInfo& info) {
  if (info.signal != 0)
    return absl::StrCat("Killed by signal ", info.signal, " (", info.message,
                        ")");
  return absl::StrCat("Exited with status ", info.status_code);
}

void Classifier::Rejected(const proto::SecurityFinding& finding,
                          proto::ExecutionResponse* response) const {
  response->set_success(false);
  response->set_status(proto::SECURITY_VIOLATION);
  response->set_error(policy::DescribeFinding(finding));
  response->set_execution_time_ms(0);
  response->set_memory_usage_mb(0);
}

void Classifier::Classify(const language::Outcome& outcome,
                          proto::ExecutionResponse* response) const {
  if (outcome.BuildFailed()) {
    ClassifyBuild(*outcome.build, response);
    return;
  }
  CHECK(outcome.run) << "Nothing was run";
  ClassifyRun(*outcome.run, response);
}

bool Classifier::MemoryExceeded(const language::StepResult& step) const {
  if (step.info.killed_for_memory) return true;
  if (step.memory_limit_kb > 0 &&
      step.info.memory_usage_kb >= step.memory_limit_kb)
    return true;
  return Failed(step.info) && profile_.IsOutOfMemory(step.stderr_text);
}

void Classifier::ClassifyBuild(const language::StepResult& build,
                               proto::ExecutionResponse* response) const {
  response->set_success(false);
  SetMeasures(build, response);
  const sandbox::ExecutionInfo& info = build.info;
  if (info.killed_by_watchdog || info.cpu_limit_exceeded) {
    response->set_status(proto::TIMEOUT);
    response->set_error(absl::StrCat("Compilation timed out after ",
                                     compile_timeout_seconds_, " seconds"));
  } else if (MemoryExceeded(build)) {
    response->set_status(proto::MEMORY_LIMIT_EXCEEDED);
    response->set_error(MemoryLimitMessage(build));
  } else {
    response->set_status(proto::COMPILATION_ERROR);
    if (!build.stderr_text.empty())
      response->set_compilation_error(build.stderr_text);
    else if (!build.stdout_text.empty())
      response->set_compilation_error(build.stdout_text);
    else
      response->set_compilation_error(DescribeTermination(info));
  }
}

void Classifier::ClassifyRun(const language::StepResult& run,
                             proto::ExecutionResponse* response) const {
  response->set_success(false);
  SetMeasures(run, response);
  const sandbox::ExecutionInfo& info = run.info;
  if (info.killed_by_watchdog || info.cpu_limit_exceeded ||
      info.wall_time_millis > int64_t{timeout_seconds_} * 1000) {
    response->set_status(proto::TIMEOUT);
    response->set_error(absl::StrCat("Execution timed out after ",
                                     timeout_seconds_, " seconds"));
  } else if (MemoryExceeded(run)) {
    response->set_status(proto::MEMORY_LIMIT_EXCEEDED);
    response->set_error(MemoryLimitMessage(run));
  } else if (Failed(info)) {
    response->set_status(proto::RUNTIME_ERROR);
    if (!run.stderr_text.empty())
      response->set_error(run.stderr_text);
    else if (!run.stdout_text.empty())
      response->set_error(run.stdout_text);
    else
      response->set_error(DescribeTermination(info));
  } else {
    response->set_success(true);
    response->set_status(proto::SUCCESS);
    response->set_output(run.stdout_text);
  }
}

bool HasSingleBody(const proto::ExecutionResponse& response) {
  bool output = response.has_output();
  bool compilation_error = response.has_compilation_error();
  bool error = response.has_error();
  switch (response.status()) {
    case proto::SUCCESS:
      return output && !compilation_error && !error;
    case proto::COMPILATION_ERROR:
      return !output && compilation_error && !error;
    default:
      return !output && !compilation_error && error;
  }
}

}  // namespace executor
