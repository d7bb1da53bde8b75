#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>

#include "clock.hpp"

namespace syncq::clock {

/*
  Deterministic clock for tests.

  Time only moves through Advance(). Advance releases every timer whose
  deadline is <= the new time, ordered by deadline and then by scheduling
  order, and Now() reports each timer's deadline while its callback runs.
  Timers scheduled by a callback fire in the same Advance when they fall
  inside the advanced window.
*/
class ManualClock final : public Clock {
 public:
  explicit ManualClock(TimePoint start = DefaultStart());

  TimePoint Now() const override;
  TimerId   Schedule(Duration delay, std::function<void()> callback) override;
  bool      Cancel(TimerId id) override;

  void Advance(Duration d);

  std::size_t PendingTimers() const;

  // 2024-01-01T00:00:00Z
  static TimePoint DefaultStart();

 private:
  using Key = std::pair<TimePoint, TimerId>;

  mutable std::mutex                     mutex_;
  TimePoint                              now_;
  std::map<Key, std::function<void()>>   timers_;
  std::unordered_map<TimerId, TimePoint> deadlines_;
  TimerId                                next_id_ = 1;
};

} // namespace syncq::clock
