#ifndef EXECUTOR_SANDBOX_LEASE_HPP
#define EXECUTOR_SANDBOX_LEASE_HPP

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "executor/slot_pool.hpp"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"

namespace executor {

// The sandbox backend or the scratch root cannot be used.
class sandbox_unavailable : public std::runtime_error {
 public:
  explicit sandbox_unavailable(const std::string& msg)
      : std::runtime_error(msg) {}
};

// Everything a single request executes with: a slot, a fresh scratch
// directory and a fresh sandbox. Nothing is shared with other leases. The
// destructor kills whatever the sandbox left running, removes the scratch
// directory and releases the slot, in this order.
class SandboxLease {
 public:
  // Throws no_slot_available if no slot frees up within wait, and
  // sandbox_unavailable if the scratch directory or the sandbox cannot be
  // created. Nothing stays acquired when the constructor throws.
  SandboxLease(SlotPool* pool, std::chrono::milliseconds wait,
               const std::string& temp_directory,
               const std::string& sandbox_name);
  ~SandboxLease();

  sandbox::Sandbox* Sandbox() const { return sandbox_.get(); }
  const std::string& ScratchDir() const { return scratch_->Path(); }

  SandboxLease(const SandboxLease&) = delete;
  SandboxLease& operator=(const SandboxLease&) = delete;
  SandboxLease(SandboxLease&&) = delete;
  SandboxLease& operator=(SandboxLease&&) = delete;

 private:
  // Declaration order is the reverse of the release order.
  SlotPool::Slot slot_;
  std::unique_ptr<util::TempDir> scratch_;
  std::unique_ptr<sandbox::Sandbox> sandbox_;
};

}  // namespace executor

#endif
