#include "language/pipeline.hpp"

#include <algorithm>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "glog/logging.h"
#include "util/file.hpp"
#include "util/utf8.hpp"

namespace language {

namespace {
const constexpr char* kBoxDir = "box";
const constexpr char* kStdinFile = "stdin";
const constexpr char* kSearchPath = "/usr/local/bin:/usr/bin:/bin";
// Compilers write object files and executables larger than any output.
const constexpr int64_t kBuildFileSizeKb = 64 * 1024;
const constexpr int64_t kStackKb = 64 * 1024;
const constexpr int32_t kRunMaxFiles = 64;
const constexpr int32_t kBuildMaxFiles = 256;
const constexpr int32_t kCpuSharePercent = 100;
}  // namespace

bool Pipeline::Run(sandbox::Sandbox* sandbox, const std::string& scratch_dir,
                   const std::string& code, const std::string& stdin_text,
                   Outcome* outcome, std::string* error_msg) const {
  std::string box = util::File::JoinPath(scratch_dir, kBoxDir);
  util::File::MakeDirs(box);
  util::File::Write(util::File::JoinPath(box, profile_.SourceFile()),
                    profile_.PrepareSource(code));
  util::File::Write(util::File::JoinPath(scratch_dir, kStdinFile), stdin_text);

  if (profile_.IsCompiled()) {
    outcome->build.emplace();
    if (!RunStep(sandbox, scratch_dir, "build", profile_.BuildCommand(),
                 /*build=*/true, &*outcome->build, error_msg))
      return false;
    const sandbox::ExecutionInfo& info = outcome->build->info;
    if (info.status_code != 0 || info.signal != 0) {
      VLOG(1) << "Build of " << profile_.Name() << " failed: " << info.message;
      return true;
    }
  }
  outcome->run.emplace();
  return RunStep(sandbox, scratch_dir, "run",
                 profile_.RunCommand(limits_.memory_limit_mb),
                 /*build=*/false, &*outcome->run, error_msg);
}

bool Pipeline::RunStep(sandbox::Sandbox* sandbox,
                       const std::string& scratch_dir, const std::string& step,
                       const Command& command, bool build, StepResult* result,
                       std::string* error_msg) const {
  std::string box = util::File::JoinPath(scratch_dir, kBoxDir);
  sandbox::ExecutionOptions options(box, command.executable);
  options.args = command.args;
  options.env = {absl::StrCat("PATH=", kSearchPath), absl::StrCat("HOME=", box),
                 absl::StrCat("TMPDIR=", box), "LANG=C.UTF-8"};
  options.stdout_file = util::File::JoinPath(scratch_dir, step + ".stdout");
  options.stderr_file = util::File::JoinPath(scratch_dir, step + ".stderr");
  if (!build) options.stdin_file = util::File::JoinPath(scratch_dir, kStdinFile);

  int64_t memory_limit_mb =
      build ? profile_.BuildMemoryMb() : limits_.memory_limit_mb;
  int64_t wall_millis = build ? limits_.build_wall_millis : limits_.run_wall_millis;
  options.wall_limit_millis = wall_millis;
  options.cpu_limit_millis = wall_millis;
  options.memory_limit_kb = memory_limit_mb * 1024;
  options.limit_address_space = profile_.LimitAddressSpace();
  options.max_procs = profile_.MaxProcs();
  options.max_files = build ? kBuildMaxFiles : kRunMaxFiles;
  options.max_file_size_kb = build ? kBuildFileSizeKb : limits_.max_output_kb;
  options.max_stack_kb = kStackKb;
  options.nice = profile_.Nice();
  options.cpu_share_percent = kCpuSharePercent;
  options.cgroup_root = limits_.cgroup_root;
  // Hides the scratch directories of the other executions.
  options.hidden_dir = util::File::BaseDir(scratch_dir);
  result->memory_limit_kb = options.memory_limit_kb;

  VLOG(1) << step << ": " << command.executable << " "
          << absl::StrJoin(command.args, " ") << " (wall " << wall_millis
          << "ms, memory " << memory_limit_mb << "MiB)";
  if (!sandbox->Execute(options, &result->info, error_msg)) {
    *error_msg = absl::StrCat(step, ": ", *error_msg);
    return false;
  }

  size_t max_bytes = limits_.max_output_kb * 1024;
  bool stdout_truncated = false;
  bool stderr_truncated = false;
  result->stdout_text = util::ValidUtf8(
      util::File::Read(options.stdout_file, max_bytes, &stdout_truncated),
      stdout_truncated);
  result->stderr_text = util::ValidUtf8(
      util::File::Read(options.stderr_file, max_bytes, &stderr_truncated),
      stderr_truncated);
  result->output_truncated = stdout_truncated || stderr_truncated;
  if (result->output_truncated)
    LOG(WARNING) << step << " output truncated to " << limits_.max_output_kb
                 << "KiB";
  return true;
}

}  // namespace language
