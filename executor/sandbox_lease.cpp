#include "executor/sandbox_lease.hpp"

#include "glog/logging.h"

namespace executor {

namespace {
std::unique_ptr<util::TempDir> MakeScratch(const std::string& temp_directory) {
  try {
    return std::unique_ptr<util::TempDir>(new util::TempDir(temp_directory));
  } catch (const std::system_error& e) {
    throw sandbox_unavailable(std::string("Scratch directory: ") + e.what());
  }
}
}  // namespace

SandboxLease::SandboxLease(SlotPool* pool, std::chrono::milliseconds wait,
                           const std::string& temp_directory,
                           const std::string& sandbox_name)
    : slot_(pool->Acquire(wait)),
      scratch_(MakeScratch(temp_directory)),
      sandbox_(sandbox::Sandbox::Create(sandbox_name)) {
  if (!sandbox_) {
    throw sandbox_unavailable(
        sandbox_name.empty() ? "No sandbox available"
                             : "Sandbox " + sandbox_name + " is not available");
  }
  VLOG(1) << "Leased " << sandbox_->Name() << " sandbox in "
          << scratch_->Path();
}

SandboxLease::~SandboxLease() {
  sandbox_->Terminate();
  sandbox_.reset();
  scratch_.reset();
  VLOG(1) << "Lease released";
}

}  // namespace executor
