#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>

#include "internal/util/time.hpp"

namespace syncq::clock {

using TimePoint = util::TimePoint;
using Duration  = util::Duration;
using TimerId   = std::uint64_t;

/*
  Clock

  The only time source of the queue. Nothing else reads system time.

  Timers never fire synchronously inside Schedule(): SystemClock runs them
  on its timer thread, ManualClock inside Advance(). Callbacks are invoked
  without any clock lock held and may schedule further timers.
*/
class Clock {
 public:
  virtual ~Clock() = default;

  virtual TimePoint Now() const = 0;

  // Run callback once delay has elapsed (delay <= 0 means "as soon as possible").
  virtual TimerId Schedule(Duration delay, std::function<void()> callback) = 0;

  // Returns false if the timer already fired or was never scheduled.
  virtual bool Cancel(TimerId id) = 0;

  // Future that becomes ready after d.
  std::future<void> Sleep(Duration d);
};

} // namespace syncq::clock
