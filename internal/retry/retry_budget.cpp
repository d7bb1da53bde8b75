#include "retry_budget.hpp"

#include <algorithm>

namespace syncq::retry {

RetryBudget::RetryBudget(BudgetPolicy policy, std::shared_ptr<clock::Clock> clock)
    : policy_(policy), clock_(std::move(clock)), tokens_(policy.capacity), last_refill_(clock_->Now()) {
  if (policy_.refill_interval.count() <= 0) policy_.refill_interval = clock::Duration(1);
}

void RetryBudget::RefillLocked(clock::TimePoint now) {
  if (tokens_ >= policy_.capacity) {
    // a full bucket does not bank time
    last_refill_ = now;
    return;
  }

  const auto elapsed_ms = std::chrono::duration_cast<clock::Duration>(now - last_refill_).count();
  if (elapsed_ms <= 0) return;

  const std::int64_t intervals = elapsed_ms / policy_.refill_interval.count();
  if (intervals == 0) return;

  const std::int64_t room = static_cast<std::int64_t>(policy_.capacity - tokens_);
  if (intervals >= room) {
    tokens_      = policy_.capacity;
    last_refill_ = now;
    return;
  }

  tokens_ += static_cast<std::uint32_t>(intervals);
  last_refill_ += policy_.refill_interval * intervals;
}

bool RetryBudget::TryConsume() {
  std::lock_guard lock(mutex_);
  RefillLocked(clock_->Now());
  if (tokens_ == 0) return false;
  --tokens_;
  return true;
}

std::uint32_t RetryBudget::Available() {
  std::lock_guard lock(mutex_);
  RefillLocked(clock_->Now());
  return tokens_;
}

} // namespace syncq::retry
