#include <cassert>
#include <chrono>
#include <iostream>
#include <set>
#include <string>

#include "internal/model/item.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace {

using syncq::model::CanPurge;
using syncq::model::CanTransition;
using syncq::model::IsTerminal;
using syncq::model::ItemStatus;
using syncq::model::Priority;

void TestPriorityOrderingAndNames() {
  assert(Priority::kCritical > Priority::kHigh);
  assert(Priority::kHigh > Priority::kNormal);
  assert(Priority::kNormal > Priority::kLow);

  for (auto priority : syncq::model::kAllPriorities) {
    assert(syncq::model::ParsePriority(syncq::model::ToString(priority)) == priority);
  }
  assert(syncq::model::ParsePriority("critical") == Priority::kCritical);
  assert(!syncq::model::ParsePriority("urgent").has_value());
}

void TestStatusNames() {
  for (auto status : syncq::model::kAllStatuses) {
    assert(syncq::model::ParseStatus(syncq::model::ToString(status)) == status);
  }
  assert(!syncq::model::ParseStatus("Lost").has_value());
}

void TestLifecycleTransitions() {
  assert(CanTransition(ItemStatus::kPending, ItemStatus::kInFlight));
  assert(CanTransition(ItemStatus::kPending, ItemStatus::kDead));
  assert(!CanTransition(ItemStatus::kPending, ItemStatus::kCommitted));

  assert(CanTransition(ItemStatus::kInFlight, ItemStatus::kCommitted));
  assert(CanTransition(ItemStatus::kInFlight, ItemStatus::kPending));
  assert(CanTransition(ItemStatus::kInFlight, ItemStatus::kDead));

  for (auto to : syncq::model::kAllStatuses) {
    assert(!CanTransition(ItemStatus::kCommitted, to));
    assert(!CanTransition(ItemStatus::kDead, to));
  }

  assert(IsTerminal(ItemStatus::kCommitted) && IsTerminal(ItemStatus::kDead));
  assert(!CanPurge(ItemStatus::kPending) && !CanPurge(ItemStatus::kInFlight));
  assert(CanPurge(ItemStatus::kCommitted) && CanPurge(ItemStatus::kDead));
}

void TestTruncateErrorKeepsUtf8Intact() {
  assert(syncq::model::TruncateError("short", 512) == "short");
  assert(syncq::model::TruncateError("abcdef", 3) == "abc");

  // "é" is two bytes; cutting between them drops the whole character
  const std::string accented = "ab\xC3\xA9";
  assert(syncq::model::TruncateError(accented, 3) == "ab");
  assert(syncq::model::TruncateError(accented, 4) == accented);

  const std::string long_error(2000, 'x');
  assert(syncq::model::TruncateError(long_error, 512).size() == 512);
}

void TestUuidV7SortsByTime() {
  const auto t0 = syncq::util::FromUnixMillis(1704067200000);

  const auto a = syncq::util::GenerateUUIDv7(t0);
  const auto b = syncq::util::GenerateUUIDv7(t0);
  const auto c = syncq::util::GenerateUUIDv7(t0 + std::chrono::milliseconds(1));

  assert(a < b);
  assert(b < c);
  assert((a[6] >> 4) == 7);

  const auto text = syncq::util::ToString(a);
  assert(text.size() == 36);
  assert(syncq::util::FromString(text) == a);

  bool threw = false;
  try {
    syncq::util::FromString("not-a-uuid");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  std::set<syncq::util::UUID> ids;
  for (int i = 0; i < 1000; ++i) ids.insert(syncq::util::GenerateUUIDv7(t0));
  assert(ids.size() == 1000);
}

void TestTimestampHelpers() {
  const auto tp = syncq::util::FromUnixMillis(1704067200123);
  assert(syncq::util::ToUnixMillis(tp) == 1704067200123);
  assert(syncq::util::FormatTimestamp(tp) == "2024-01-01T00:00:00.123Z");
}

} // namespace

int main() {
  TestPriorityOrderingAndNames();
  TestStatusNames();
  TestLifecycleTransitions();
  TestTruncateErrorKeepsUtf8Intact();
  TestUuidV7SortsByTime();
  TestTimestampHelpers();

  std::cout << "syncq_unit_item_model: pass\n";
  return 0;
}
