#include "item.hpp"

namespace syncq::model {

std::string_view ToString(Priority priority) {
  switch (priority) {
    case Priority::kLow:
      return "Low";
    case Priority::kNormal:
      return "Normal";
    case Priority::kHigh:
      return "High";
    case Priority::kCritical:
      return "Critical";
  }
  return "Unknown";
}

std::optional<Priority> ParsePriority(std::string_view text) {
  for (auto priority : kAllPriorities) {
    if (ToString(priority) == text) return priority;
  }
  if (text == "low") return Priority::kLow;
  if (text == "normal") return Priority::kNormal;
  if (text == "high") return Priority::kHigh;
  if (text == "critical") return Priority::kCritical;
  return std::nullopt;
}

std::string_view ToString(ItemStatus status) {
  switch (status) {
    case ItemStatus::kPending:
      return "Pending";
    case ItemStatus::kInFlight:
      return "InFlight";
    case ItemStatus::kCommitted:
      return "Committed";
    case ItemStatus::kDead:
      return "Dead";
  }
  return "Unknown";
}

std::optional<ItemStatus> ParseStatus(std::string_view text) {
  for (auto status : kAllStatuses) {
    if (ToString(status) == text) return status;
  }
  return std::nullopt;
}

std::string TruncateError(std::string_view text, std::size_t max_bytes) {
  if (text.size() <= max_bytes) return std::string(text);

  std::size_t cut = max_bytes;
  // back off continuation bytes (10xxxxxx) so the cut lands on a code point start
  while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  return std::string(text.substr(0, cut));
}

} // namespace syncq::model
