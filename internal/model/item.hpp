#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace syncq::model {

using ItemId = util::UUID;

// Stored as its integer value; larger is more urgent.
enum class Priority : std::uint8_t {
  kLow      = 0,
  kNormal   = 1,
  kHigh     = 2,
  kCritical = 3,
};

enum class ItemStatus : std::uint8_t {
  kPending   = 0,
  kInFlight  = 1,
  kCommitted = 2,
  kDead      = 3,
};

inline constexpr std::array<Priority, 4> kAllPriorities = {Priority::kCritical, Priority::kHigh, Priority::kNormal, Priority::kLow};

inline constexpr std::array<ItemStatus, 4> kAllStatuses = {ItemStatus::kPending, ItemStatus::kInFlight, ItemStatus::kCommitted,
                                                           ItemStatus::kDead};

std::string_view        ToString(Priority priority);
std::optional<Priority> ParsePriority(std::string_view text);

std::string_view          ToString(ItemStatus status);
std::optional<ItemStatus> ParseStatus(std::string_view text);

// Everything about an item except its payload.
struct ItemView {
  ItemId                     id{};
  std::optional<std::string> idempotency_key;
  Priority                   priority = Priority::kNormal;
  ItemStatus                 status   = ItemStatus::kPending;
  std::uint32_t              attempts = 0;
  std::optional<std::string> last_error;
  std::string                payload_codec;
  util::TimePoint            enqueued_at{};
  util::TimePoint            updated_at{};
  util::TimePoint            next_attempt_at{};
  std::optional<util::TimePoint> reservation_deadline;
};

/*
  Cut a diagnostic to at most max_bytes without splitting a UTF-8
  sequence.
*/
std::string TruncateError(std::string_view text, std::size_t max_bytes);

} // namespace syncq::model
