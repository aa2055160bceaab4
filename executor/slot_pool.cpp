#include "executor/slot_pool.hpp"

#include <thread>

#include "glog/logging.h"

namespace executor {

SlotPool::SlotPool(size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) capacity_ = std::thread::hardware_concurrency();
  if (capacity_ == 0) capacity_ = 1;
}

SlotPool::Slot SlotPool::Acquire(std::chrono::milliseconds wait) {
  std::unique_lock<std::mutex> lck(mutex_);
  if (!released_.wait_for(lck, wait,
                          [this] { return in_use_ < capacity_; })) {
    throw no_slot_available("Execution failed: all sandboxes are busy");
  }
  in_use_++;
  VLOG(1) << "Slot acquired, " << in_use_ << "/" << capacity_ << " in use";
  return Slot(this);
}

size_t SlotPool::InUse() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return in_use_;
}

void SlotPool::Release() {
  {
    std::lock_guard<std::mutex> lck(mutex_);
    CHECK_GT(in_use_, 0u);
    in_use_--;
  }
  released_.notify_one();
}

SlotPool::Slot::~Slot() {
  if (pool_ != nullptr) pool_->Release();
}

}  // namespace executor
