#ifndef LANGUAGE_PIPELINE_HPP
#define LANGUAGE_PIPELINE_HPP

#include <cstdint>
#include <string>

#include "absl/types/optional.h"
#include "language/profile.hpp"
#include "sandbox/sandbox.hpp"

namespace language {

// Limits of the steps of a pipeline.
struct StepLimits {
  // Budget of the run step before the watchdog fires, grace included.
  int64_t run_wall_millis = 0;
  int64_t build_wall_millis = 0;
  int64_t memory_limit_mb = 0;
  int64_t max_output_kb = 0;
  // Forwarded to sandbox::ExecutionOptions::cgroup_root.
  std::string cgroup_root;
};

// What a single sandboxed step produced.
struct StepResult {
  sandbox::ExecutionInfo info;
  std::string stdout_text;
  std::string stderr_text;
  bool output_truncated = false;
  int64_t memory_limit_kb = 0;
};

struct Outcome {
  // Set for compiled languages.
  absl::optional<StepResult> build;
  // Set unless the build failed.
  absl::optional<StepResult> run;
  bool BuildFailed() const {
    return build && !run;
  }
};

// Builds and runs one program in a sandbox. The scratch directory gets a box/
// subdirectory, the working directory of the program, and the files holding
// the standard streams, outside of it.
class Pipeline {
 public:
  Pipeline(const LanguageProfile& profile, StepLimits limits)
      : profile_(profile), limits_(std::move(limits)) {}

  // Returns false and sets error_msg if the sandbox could not run a step.
  // Throws std::system_error on scratch I/O failures and std::runtime_error if
  // the toolchain is missing.
  bool Run(sandbox::Sandbox* sandbox, const std::string& scratch_dir,
           const std::string& code, const std::string& stdin_text,
           Outcome* outcome, std::string* error_msg) const;

 private:
  bool RunStep(sandbox::Sandbox* sandbox, const std::string& scratch_dir,
               const std::string& step, const Command& command,
               bool build, StepResult* result, std::string* error_msg) const;

  const LanguageProfile& profile_;
  StepLimits limits_;
};

}  // namespace language

#endif
