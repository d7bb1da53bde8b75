#include "internal/retry/retry_budget.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/clock/manual_clock.hpp"
#include "internal/retry/retry_engine.hpp"
#include "internal/util/uuid.hpp"

namespace {

using syncq::clock::ManualClock;
using syncq::retry::BudgetPolicy;
using syncq::retry::RetryBudget;
using syncq::util::Duration;

BudgetPolicy Policy(std::uint32_t capacity, std::int64_t refill_ms) {
  BudgetPolicy policy;
  policy.capacity        = capacity;
  policy.refill_interval = Duration(refill_ms);
  return policy;
}

void TestStartsFullAndDrains() {
  auto        clock = std::make_shared<ManualClock>();
  RetryBudget budget(Policy(3, 1000), clock);

  assert(budget.Available() == 3);
  assert(budget.TryConsume());
  assert(budget.TryConsume());
  assert(budget.TryConsume());
  assert(!budget.TryConsume());
  assert(budget.Available() == 0);
}

void TestRefillsOneTokenPerInterval() {
  auto        clock = std::make_shared<ManualClock>();
  RetryBudget budget(Policy(3, 1000), clock);
  for (int i = 0; i < 3; ++i) assert(budget.TryConsume());

  clock->Advance(Duration(999));
  assert(!budget.TryConsume());

  clock->Advance(Duration(1));
  assert(budget.Available() == 1);

  // partial intervals carry over
  clock->Advance(Duration(1500));
  assert(budget.Available() == 2);
  clock->Advance(Duration(500));
  assert(budget.Available() == 3);
}

void TestNeverExceedsCapacity() {
  auto        clock = std::make_shared<ManualClock>();
  RetryBudget budget(Policy(2, 100), clock);

  assert(budget.TryConsume());
  clock->Advance(Duration(100000));
  assert(budget.Available() == 2);
}

void TestFullBucketDoesNotBankTime() {
  auto        clock = std::make_shared<ManualClock>();
  RetryBudget budget(Policy(2, 1000), clock);

  clock->Advance(Duration(10000));
  assert(budget.TryConsume());
  assert(budget.TryConsume());
  assert(!budget.TryConsume());

  clock->Advance(Duration(999));
  assert(budget.Available() == 0);
}

void TestNonPositiveIntervalIsCoerced() {
  auto        clock = std::make_shared<ManualClock>();
  RetryBudget budget(Policy(1, 0), clock);

  assert(budget.RefillInterval() == Duration(1));
  assert(budget.TryConsume());
  clock->Advance(Duration(1));
  assert(budget.TryConsume());
}

} // namespace

// the bucket is charged when a retry is about to be sent, not when it fails
void TestEngineChargesReservedRetries() {
  auto clock = std::make_shared<ManualClock>();

  syncq::retry::RetryPolicy retry;
  retry.base_delay = Duration(5000);
  retry.jitter     = syncq::retry::JitterMode::kNone;
  syncq::retry::RetryEngine engine(retry, Policy(1, 100), syncq::retry::BreakerPolicy{}, clock);

  for (int i = 0; i < 10; ++i) {
    const auto decision = engine.OnFailure(syncq::util::GenerateUUIDv7(clock->Now()), 1, syncq::retry::ErrorClass::kRetryable);
    assert(decision.verdict == syncq::retry::RetryDecision::Verdict::kRetryAfter);
    assert(decision.next_attempt_at == clock->Now() + Duration(5000));
  }
  assert(engine.Budget().Available() == 1);

  // first attempts are free
  for (int i = 0; i < 5; ++i) assert(engine.FundAttempt(1));
  assert(engine.Budget().Available() == 1);

  assert(engine.FundAttempt(2));
  assert(!engine.FundAttempt(3));
  assert(engine.ThrottledUntil() == clock->Now() + Duration(100));

  clock->Advance(Duration(100));
  assert(engine.FundAttempt(2));
  assert(!engine.FundAttempt(2));
}

int main() {
  TestStartsFullAndDrains();
  TestRefillsOneTokenPerInterval();
  TestNeverExceedsCapacity();
  TestFullBucketDoesNotBankTime();
  TestNonPositiveIntervalIsCoerced();
  TestEngineChargesReservedRetries();

  std::cout << "syncq_unit_retry_budget: pass\n";
  return 0;
}
