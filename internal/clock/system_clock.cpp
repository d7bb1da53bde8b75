#include "system_clock.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace syncq::clock {

SystemClock::SystemClock() : thread_(&SystemClock::Run, this) {
}

SystemClock::~SystemClock() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

TimePoint SystemClock::Now() const {
  return std::chrono::time_point_cast<std::chrono::system_clock::duration>(std::chrono::system_clock::now());
}

TimerId SystemClock::Schedule(Duration delay, std::function<void()> callback) {
  const auto deadline = std::chrono::steady_clock::now() + (delay.count() > 0 ? delay : Duration::zero());

  TimerId id = 0;
  {
    std::lock_guard lock(mutex_);
    id = next_id_++;
    timers_.emplace(Key{deadline, id}, std::move(callback));
    deadlines_.emplace(id, deadline);
  }
  cv_.notify_all();
  return id;
}

bool SystemClock::Cancel(TimerId id) {
  std::lock_guard lock(mutex_);
  auto            it = deadlines_.find(id);
  if (it == deadlines_.end()) return false;

  timers_.erase(Key{it->second, id});
  deadlines_.erase(it);
  return true;
}

void SystemClock::Run() {
  std::unique_lock lock(mutex_);

  while (!shutdown_) {
    if (timers_.empty()) {
      cv_.wait(lock, [this] { return shutdown_ || !timers_.empty(); });
      continue;
    }

    const auto deadline = timers_.begin()->first.first;
    if (std::chrono::steady_clock::now() < deadline) {
      // woken early by a new timer, a cancel or shutdown; re-evaluate
      cv_.wait_until(lock, deadline);
      continue;
    }

    auto node = timers_.extract(timers_.begin());
    deadlines_.erase(node.key().second);

    lock.unlock();
    try {
      node.mapped()();
    } catch (const std::exception& e) {
      SYNCQ_LOG_ERROR("timer callback failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace syncq::clock
