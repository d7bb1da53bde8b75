#pragma once

#include <cstdint>
#include <memory>
#include <mutex>

#include "internal/clock/clock.hpp"

namespace syncq::retry {

struct BudgetPolicy {
  std::uint32_t   capacity = 20;
  clock::Duration refill_interval{1000}; // one token per interval
};

/*
  Token bucket bounding retries independently of per-item backoff.

  Starts full. Refill is computed lazily on each call in whole intervals
  of integer milliseconds; the remainder of a partial interval carries
  over to the next call.
*/
class RetryBudget {
 public:
  RetryBudget(BudgetPolicy policy, std::shared_ptr<clock::Clock> clock);

  // take one token for a retry; false means throttle
  bool TryConsume();

  std::uint32_t Available();

  clock::Duration RefillInterval() const {
    return policy_.refill_interval;
  }

 private:
  void RefillLocked(clock::TimePoint now);

  BudgetPolicy                  policy_;
  std::shared_ptr<clock::Clock> clock_;

  std::mutex       mutex_;
  std::uint32_t    tokens_;
  clock::TimePoint last_refill_;
};

} // namespace syncq::retry
