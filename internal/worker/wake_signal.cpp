#include "wake_signal.hpp"

namespace syncq::worker {

void WakeSignal::Notify() {
  {
    std::lock_guard lock(mutex_);
    pending_ = true;
  }
  cv_.notify_one();
}

bool WakeSignal::Wait() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || pending_; });

  if (shutdown_) return false;

  pending_ = false;
  return true;
}

void WakeSignal::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

void WakeSignal::Reset() {
  std::lock_guard lock(mutex_);
  shutdown_ = false;
  pending_  = false;
}

} // namespace syncq::worker
