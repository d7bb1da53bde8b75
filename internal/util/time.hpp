#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace syncq::util {

/*
  Timestamp helpers. Instants are wall-clock time points; the store
  persists them as signed unix milliseconds.
*/

using TimePoint = std::chrono::system_clock::time_point;
using Duration  = std::chrono::milliseconds;

std::int64_t ToUnixMillis(TimePoint tp);
TimePoint    FromUnixMillis(std::int64_t ms);

// ISO-8601 UTC with millisecond precision, for logs and the CLI
std::string FormatTimestamp(TimePoint tp);

} // namespace syncq::util
