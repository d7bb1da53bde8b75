#include "internal/retry/retry_strategy.hpp"

#include <cassert>
#include <iostream>
#include <limits>

namespace {

using syncq::retry::Duration;
using syncq::retry::ErrorClass;
using syncq::retry::JitterMode;
using syncq::retry::RetryPolicy;
using syncq::retry::RetryStrategy;
using Kind = syncq::retry::StrategyDecision::Kind;

RetryPolicy Policy(JitterMode jitter) {
  RetryPolicy policy;
  policy.base_delay   = Duration(1000);
  policy.max_delay    = Duration(60000);
  policy.max_exponent = 10;
  policy.max_attempts = 8;
  policy.jitter       = jitter;
  policy.auth_floor   = Duration(30000);
  return policy;
}

void TestExponentialBackoffIsCapped() {
  RetryStrategy strategy(Policy(JitterMode::kNone), 1);

  assert(strategy.Backoff(1) == Duration(1000));
  assert(strategy.Backoff(2) == Duration(2000));
  assert(strategy.Backoff(3) == Duration(4000));
  assert(strategy.Backoff(6) == Duration(32000));
  assert(strategy.Backoff(7) == Duration(60000));
  assert(strategy.Backoff(40) == Duration(60000));

  assert(strategy.Decide(1, ErrorClass::kRetryable).delay == Duration(1000));
  assert(strategy.Decide(3, ErrorClass::kTimeout).delay == Duration(4000));
}

void TestMaxExponentLimitsGrowth() {
  auto policy         = Policy(JitterMode::kNone);
  policy.max_exponent = 2;
  policy.max_delay    = Duration(std::numeric_limits<std::int64_t>::max());
  RetryStrategy strategy(policy, 1);

  assert(strategy.Backoff(3) == Duration(4000));
  assert(strategy.Backoff(30) == Duration(4000));
}

void TestLargeExponentDoesNotOverflow() {
  auto policy         = Policy(JitterMode::kNone);
  policy.max_exponent = 200;
  RetryStrategy strategy(policy, 1);

  assert(strategy.Backoff(100) == Duration(60000));
  assert(strategy.Backoff(std::numeric_limits<std::uint32_t>::max()) == Duration(60000));
}

void TestExhaustionAndNonRetryable() {
  RetryStrategy strategy(Policy(JitterMode::kNone), 1);

  assert(strategy.Decide(7, ErrorClass::kRetryable).kind == Kind::kRetry);
  assert(strategy.Decide(8, ErrorClass::kRetryable).kind == Kind::kExhausted);
  assert(strategy.Decide(9, ErrorClass::kAuth).kind == Kind::kExhausted);
  assert(strategy.Decide(1, ErrorClass::kNonRetryable).kind == Kind::kNonRetryable);
}

void TestAuthFloor() {
  RetryStrategy strategy(Policy(JitterMode::kNone), 1);

  assert(strategy.Decide(1, ErrorClass::kAuth).delay == Duration(30000));
  assert(strategy.Decide(7, ErrorClass::kAuth).delay == Duration(60000));
}

void TestJitterStaysInRange() {
  RetryStrategy full(Policy(JitterMode::kFull), 42);
  RetryStrategy equal(Policy(JitterMode::kEqual), 42);
  RetryStrategy decorrelated(Policy(JitterMode::kDecorrelated), 42);

  bool full_varied = false;
  for (int i = 0; i < 500; ++i) {
    const auto f = full.Decide(4, ErrorClass::kRetryable).delay;
    assert(f >= Duration(0) && f <= Duration(8000));
    if (f != Duration(8000)) full_varied = true;

    const auto e = equal.Decide(4, ErrorClass::kRetryable).delay;
    assert(e >= Duration(4000) && e <= Duration(8000));

    const auto d = decorrelated.Decide(4, ErrorClass::kRetryable, Duration(5000)).delay;
    assert(d >= Duration(1000) && d <= Duration(15000));

    const auto capped = decorrelated.Decide(4, ErrorClass::kRetryable, Duration(50000)).delay;
    assert(capped >= Duration(1000) && capped <= Duration(60000));
  }
  assert(full_varied);

  // without history decorrelated jitter starts from base
  const auto first = decorrelated.Decide(1, ErrorClass::kRetryable).delay;
  assert(first >= Duration(1000) && first <= Duration(3000));
}

void TestSeededStrategiesAgree() {
  RetryStrategy a(Policy(JitterMode::kFull), 7);
  RetryStrategy b(Policy(JitterMode::kFull), 7);
  for (std::uint32_t attempt = 1; attempt < 8; ++attempt) {
    assert(a.Decide(attempt, ErrorClass::kRetryable).delay == b.Decide(attempt, ErrorClass::kRetryable).delay);
  }
}

} // namespace

int main() {
  TestExponentialBackoffIsCapped();
  TestMaxExponentLimitsGrowth();
  TestLargeExponentDoesNotOverflow();
  TestExhaustionAndNonRetryable();
  TestAuthFloor();
  TestJitterStaysInRange();
  TestSeededStrategiesAgree();

  std::cout << "syncq_unit_retry_strategy: pass\n";
  return 0;
}
