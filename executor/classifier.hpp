#ifndef EXECUTOR_CLASSIFIER_HPP
#define EXECUTOR_CLASSIFIER_HPP

#include <cstdint>

#include "absl/types/optional.h"
#include "language/pipeline.hpp"
#include "language/profile.hpp"
#include "proto/codebox.pb.h"

namespace executor {

// Maps what the pipeline produced to exactly one status, with the precedence
// SECURITY_VIOLATION > TIMEOUT > MEMORY_LIMIT_EXCEEDED > COMPILATION_ERROR >
// RUNTIME_ERROR > SUCCESS.
class Classifier {
 public:
  Classifier(const language::LanguageProfile& profile, int32_t timeout_seconds,
             int32_t compile_timeout_seconds)
      : profile_(profile),
        timeout_seconds_(timeout_seconds),
        compile_timeout_seconds_(compile_timeout_seconds) {}

  // Code rejected before anything ran.
  void Rejected(const proto::SecurityFinding& finding,
                proto::ExecutionResponse* response) const;

  // Sets success, status, the body field, execution_time_ms and
  // memory_usage_mb. The outcome must contain at least one step.
  void Classify(const language::Outcome& outcome,
                proto::ExecutionResponse* response) const;

 private:
  void ClassifyBuild(const language::StepResult& build,
                     proto::ExecutionResponse* response) const;
  void ClassifyRun(const language::StepResult& run,
                   proto::ExecutionResponse* response) const;
  bool MemoryExceeded(const language::StepResult& step) const;

  const language::LanguageProfile& profile_;
  int32_t timeout_seconds_;
  int32_t compile_timeout_seconds_;
};

// True if the body field that the status calls for is the only one set.
bool HasSingleBody(const proto::ExecutionResponse& response);

// Describes how a process ended, for errors with no output to show.
std::string DescribeTermination(const sandbox::ExecutionInfo& info);

}  // namespace executor

#endif
