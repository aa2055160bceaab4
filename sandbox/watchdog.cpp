#include "sandbox/watchdog.hpp"

#include <signal.h>

#include "glog/logging.h"

namespace sandbox {

Watchdog::Watchdog(pid_t pgid, std::chrono::milliseconds budget)
    : pgid_(pgid), armed_(budget.count() > 0) {
  if (!armed_) return;
  auto deadline = std::chrono::steady_clock::now() + budget;
  thread_ = std::thread(&Watchdog::Run, this, deadline);
}

Watchdog::~Watchdog() { Disarm(); }

void Watchdog::Disarm() {
  {
    std::lock_guard<std::mutex> lck(mutex_);
    disarmed_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void Watchdog::Run(std::chrono::steady_clock::time_point deadline) {
  std::unique_lock<std::mutex> lck(mutex_);
  if (cv_.wait_until(lck, deadline, [this] { return disarmed_; })) return;
  VLOG(1) << "Watchdog expired, killing process group " << pgid_;
  fired_ = true;
  if (kill(-pgid_, SIGKILL) == -1 && errno != ESRCH) {
    PLOG(ERROR) << "Watchdog could not kill process group " << pgid_;
  }
}

}  // namespace sandbox
