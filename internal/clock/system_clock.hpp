#pragma once

#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>

#include "clock.hpp"

namespace syncq::clock {

/*
  Wall-clock timestamps, monotonic scheduling.

  One background thread waits for the earliest deadline on
  std::chrono::steady_clock so that wall-clock jumps do not stretch or
  shrink a pending sleep.
*/
class SystemClock final : public Clock {
 public:
  SystemClock();
  ~SystemClock() override;

  SystemClock(const SystemClock&)            = delete;
  SystemClock& operator=(const SystemClock&) = delete;

  TimePoint Now() const override;
  TimerId   Schedule(Duration delay, std::function<void()> callback) override;
  bool      Cancel(TimerId id) override;

 private:
  using Deadline = std::chrono::steady_clock::time_point;
  using Key      = std::pair<Deadline, TimerId>;

  void Run();

  std::mutex                            mutex_;
  std::condition_variable               cv_;
  std::map<Key, std::function<void()>>  timers_;
  std::unordered_map<TimerId, Deadline> deadlines_;
  TimerId                               next_id_  = 1;
  bool                                  shutdown_ = false;
  std::thread                           thread_;
};

} // namespace syncq::clock
