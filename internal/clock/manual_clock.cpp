#include "manual_clock.hpp"

namespace syncq::clock {

ManualClock::ManualClock(TimePoint start) : now_(start) {
}

TimePoint ManualClock::DefaultStart() {
  return util::FromUnixMillis(1704067200000);
}

TimePoint ManualClock::Now() const {
  std::lock_guard lock(mutex_);
  return now_;
}

TimerId ManualClock::Schedule(Duration delay, std::function<void()> callback) {
  std::lock_guard lock(mutex_);
  const auto      deadline = now_ + (delay.count() > 0 ? delay : Duration::zero());
  const auto      id       = next_id_++;
  timers_.emplace(Key{deadline, id}, std::move(callback));
  deadlines_.emplace(id, deadline);
  return id;
}

bool ManualClock::Cancel(TimerId id) {
  std::lock_guard lock(mutex_);
  auto            it = deadlines_.find(id);
  if (it == deadlines_.end()) return false;

  timers_.erase(Key{it->second, id});
  deadlines_.erase(it);
  return true;
}

void ManualClock::Advance(Duration d) {
  std::unique_lock lock(mutex_);
  const auto       target = now_ + (d.count() > 0 ? d : Duration::zero());

  for (;;) {
    if (timers_.empty() || timers_.begin()->first.first > target) break;

    auto node = timers_.extract(timers_.begin());
    deadlines_.erase(node.key().second);
    if (node.key().first > now_) now_ = node.key().first;

    lock.unlock();
    node.mapped()();
    lock.lock();
  }

  now_ = target;
}

std::size_t ManualClock::PendingTimers() const {
  std::lock_guard lock(mutex_);
  return timers_.size();
}

} // namespace syncq::clock
