#include "executor/runtime_status.hpp"

#include <memory>
#include <vector>

#include "absl/strings/str_join.h"
#include "glog/logging.h"
#include "language/profile.hpp"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"

namespace executor {

bool RuntimeStatus::Available() const {
  absl::MutexLock lck(&mutex_);
  return available_;
}

std::string RuntimeStatus::Reason() const {
  absl::MutexLock lck(&mutex_);
  return reason_;
}

void RuntimeStatus::MarkUnavailable(const std::string& reason) {
  absl::MutexLock lck(&mutex_);
  if (available_) LOG(ERROR) << "Sandbox runtime unavailable: " << reason;
  available_ = false;
  reason_ = reason;
}

proto::HealthResponse RuntimeStatus::Probe() {
  std::vector<std::string> problems;
  bool runtime_ok = true;
  bool isolated = true;
  std::unique_ptr<sandbox::Sandbox> box =
      sandbox::Sandbox::Create(sandbox_name_);
  if (!box) {
    runtime_ok = false;
    problems.push_back(sandbox_name_.empty()
                           ? "no sandbox backend available"
                           : "sandbox " + sandbox_name_ + " not available");
  } else if (!box->Isolated() && sandbox_name_.empty()) {
    // A backend named on the command line is the operator's choice.
    isolated = false;
    problems.push_back("sandbox " + box->Name() +
                       " does not isolate the network and the filesystem");
  }
  try {
    util::TempDir probe(temp_directory_);
    util::File::Write(util::File::JoinPath(probe.Path(), "probe"), "ok");
  } catch (const std::system_error& e) {
    runtime_ok = false;
    problems.push_back(std::string("scratch root not writable: ") + e.what());
  }
  bool toolchains_ok = true;
  for (const language::LanguageProfile* profile :
       language::LanguageProfile::All()) {
    if (!profile->Available()) {
      toolchains_ok = false;
      problems.push_back(profile->Name() + " toolchain missing");
    }
  }

  proto::HealthResponse response;
  response.set_sandbox_runtime_available(runtime_ok);
  if (!execution_enabled_) {
    response.set_status("DISABLED");
    problems.insert(problems.begin(), "execution disabled");
  } else if (runtime_ok && isolated && toolchains_ok) {
    response.set_status("UP");
  } else {
    response.set_status("DEGRADED");
  }
  response.set_message(problems.empty() ? "OK"
                                        : absl::StrJoin(problems, "; "));
  if (response.status() != "UP")
    LOG(WARNING) << "Health " << response.status() << ": "
                 << response.message();

  absl::MutexLock lck(&mutex_);
  available_ = runtime_ok;
  reason_ = runtime_ok ? "" : response.message();
  return response;
}

}  // namespace executor
