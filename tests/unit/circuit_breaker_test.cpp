#include "internal/retry/circuit_breaker.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <utility>
#include <vector>

#include "internal/clock/manual_clock.hpp"

namespace {

using syncq::clock::ManualClock;
using syncq::retry::BreakerPolicy;
using syncq::retry::BreakerState;
using syncq::retry::CircuitBreaker;
using syncq::util::Duration;

BreakerPolicy Policy() {
  BreakerPolicy policy;
  policy.failure_threshold     = 3;
  policy.success_threshold     = 2;
  policy.cool_off              = Duration(10000);
  policy.half_open_probe_count = 1;
  return policy;
}

void Fail(CircuitBreaker& breaker, int times) {
  for (int i = 0; i < times; ++i) {
    assert(breaker.Acquire().admitted);
    breaker.RecordFailure();
  }
}

void TestOpensAfterConsecutiveFailures() {
  auto           clock = std::make_shared<ManualClock>();
  CircuitBreaker breaker(Policy(), clock);

  Fail(breaker, 2);
  assert(breaker.State() == BreakerState::kClosed);

  // a success in between clears the streak
  assert(breaker.Acquire().admitted);
  breaker.RecordSuccess();
  Fail(breaker, 2);
  assert(breaker.State() == BreakerState::kClosed);

  Fail(breaker, 1);
  assert(breaker.State() == BreakerState::kOpen);
  assert(breaker.NextProbeAt() == clock->Now() + Duration(10000));
}

void TestWithoutResetOnSuccessFailuresAccumulate() {
  auto policy             = Policy();
  policy.reset_on_success = false;
  auto           clock    = std::make_shared<ManualClock>();
  CircuitBreaker breaker(policy, clock);

  Fail(breaker, 2);
  assert(breaker.Acquire().admitted);
  breaker.RecordSuccess();
  Fail(breaker, 1);
  assert(breaker.State() == BreakerState::kOpen);
}

void TestOpenRejectsUntilCoolOff() {
  auto           clock = std::make_shared<ManualClock>();
  CircuitBreaker breaker(Policy(), clock);
  Fail(breaker, 3);
  const auto opened_at = clock->Now();

  clock->Advance(Duration(9999));
  auto permit = breaker.Acquire();
  assert(!permit.admitted);
  assert(permit.until == opened_at + Duration(10000));

  clock->Advance(Duration(1));
  permit = breaker.Acquire();
  assert(permit.admitted);
  assert(breaker.State() == BreakerState::kHalfOpen);
  assert(!breaker.NextProbeAt().has_value());
}

void TestHalfOpenLimitsProbesAndCloses() {
  auto           clock = std::make_shared<ManualClock>();
  CircuitBreaker breaker(Policy(), clock);
  Fail(breaker, 3);
  clock->Advance(Duration(10000));

  assert(breaker.Acquire().admitted);
  auto saturated = breaker.Acquire();
  assert(!saturated.admitted);
  assert(saturated.until == clock->Now() + Duration(10000));

  breaker.RecordSuccess();
  assert(breaker.State() == BreakerState::kHalfOpen);

  assert(breaker.Acquire().admitted);
  breaker.RecordSuccess();
  assert(breaker.State() == BreakerState::kClosed);
}

void TestHalfOpenFailureReopens() {
  auto           clock = std::make_shared<ManualClock>();
  CircuitBreaker breaker(Policy(), clock);
  Fail(breaker, 3);
  clock->Advance(Duration(10000));

  assert(breaker.Acquire().admitted);
  clock->Advance(Duration(500));
  breaker.RecordFailure();
  assert(breaker.State() == BreakerState::kOpen);
  assert(breaker.NextProbeAt() == clock->Now() + Duration(10000));
}

void TestReleaseFreesProbeSlot() {
  auto           clock = std::make_shared<ManualClock>();
  CircuitBreaker breaker(Policy(), clock);
  Fail(breaker, 3);
  clock->Advance(Duration(10000));

  assert(breaker.Acquire().admitted);
  assert(!breaker.Acquire().admitted);
  breaker.Release();
  assert(breaker.Acquire().admitted);
}

void TestResultsWhileOpenAreIgnored() {
  auto           clock = std::make_shared<ManualClock>();
  CircuitBreaker breaker(Policy(), clock);
  Fail(breaker, 3);

  breaker.RecordSuccess();
  breaker.RecordSuccess();
  assert(breaker.State() == BreakerState::kOpen);
}

void TestListenerSeesEveryTransition() {
  auto           clock = std::make_shared<ManualClock>();
  CircuitBreaker breaker(Policy(), clock);

  std::vector<std::pair<BreakerState, BreakerState>> seen;
  breaker.SetListener([&](BreakerState from, BreakerState to) {
    seen.emplace_back(from, to);
    // listener runs without the breaker lock held
    (void)breaker.NextProbeAt();
  });

  Fail(breaker, 3);
  clock->Advance(Duration(10000));
  assert(breaker.Acquire().admitted);
  breaker.RecordSuccess();
  assert(breaker.Acquire().admitted);
  breaker.RecordSuccess();

  const std::vector<std::pair<BreakerState, BreakerState>> expected = {
      {BreakerState::kClosed, BreakerState::kOpen},
      {BreakerState::kOpen, BreakerState::kHalfOpen},
      {BreakerState::kHalfOpen, BreakerState::kClosed},
  };
  assert(seen == expected);
}

void TestZeroThresholdsAreCoerced() {
  BreakerPolicy policy;
  policy.failure_threshold     = 0;
  policy.success_threshold     = 0;
  policy.half_open_probe_count = 0;
  auto           clock         = std::make_shared<ManualClock>();
  CircuitBreaker breaker(policy, clock);

  Fail(breaker, 1);
  assert(breaker.State() == BreakerState::kOpen);
}

} // namespace

int main() {
  TestOpensAfterConsecutiveFailures();
  TestWithoutResetOnSuccessFailuresAccumulate();
  TestOpenRejectsUntilCoolOff();
  TestHalfOpenLimitsProbesAndCloses();
  TestHalfOpenFailureReopens();
  TestReleaseFreesProbeSlot();
  TestResultsWhileOpenAreIgnored();
  TestListenerSeesEveryTransition();
  TestZeroThresholdsAreCoerced();

  std::cout << "syncq_unit_circuit_breaker: pass\n";
  return 0;
}
