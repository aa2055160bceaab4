#ifndef EXECUTOR_SLOT_POOL_HPP
#define EXECUTOR_SLOT_POOL_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <stdexcept>

namespace executor {

class no_slot_available : public std::runtime_error {
 public:
  explicit no_slot_available(const char* msg) : std::runtime_error(msg) {}
};

// A bounded number of concurrent executions.
class SlotPool {
 public:
  // An acquired slot, released on destruction.
  class Slot {
   public:
    Slot(Slot&& other) noexcept : pool_(other.pool_) { other.pool_ = nullptr; }
    Slot& operator=(Slot&&) = delete;
    Slot(const Slot&) = delete;
    Slot& operator=(const Slot&) = delete;
    ~Slot();

   private:
    friend class SlotPool;
    explicit Slot(SlotPool* pool) : pool_(pool) {}
    SlotPool* pool_;
  };

  // A capacity of 0 means one slot per hardware thread.
  explicit SlotPool(size_t capacity);

  // Waits at most wait for a free slot. Throws no_slot_available on timeout.
  Slot Acquire(std::chrono::milliseconds wait);

  size_t Capacity() const { return capacity_; }
  size_t InUse() const;

  SlotPool(const SlotPool&) = delete;
  SlotPool& operator=(const SlotPool&) = delete;

 private:
  void Release();

  size_t capacity_;
  size_t in_use_ = 0;
  mutable std::mutex mutex_;
  std::condition_variable released_;
};

}  // namespace executor

#endif
