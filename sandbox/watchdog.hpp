#ifndef SANDBOX_WATCHDOG_HPP
#define SANDBOX_WATCHDOG_HPP

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace sandbox {

// Kills a process group with SIGKILL when a wall-clock deadline passes,
// unless it is disarmed first. The deadline is measured from construction.
// The process group must not be reaped before the watchdog is disarmed.
class Watchdog {
 public:
  // A zero budget arms nothing: the watchdog never fires.
  Watchdog(pid_t pgid, std::chrono::milliseconds budget);
  ~Watchdog();

  // Stops the watchdog and waits for its thread. Idempotent.
  void Disarm();
  bool Fired() const { return fired_; }

  Watchdog(const Watchdog&) = delete;
  Watchdog& operator=(const Watchdog&) = delete;

 private:
  void Run(std::chrono::steady_clock::time_point deadline);

  pid_t pgid_;
  bool armed_;
  std::mutex mutex_;
  std::condition_variable cv_;
  bool disarmed_ = false;
  std::atomic<bool> fired_{false};
  std::thread thread_;
};

}  // namespace sandbox

#endif
