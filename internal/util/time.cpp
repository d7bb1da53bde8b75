#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace syncq::util {

std::int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(std::int64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

std::string FormatTimestamp(TimePoint tp) {
  const auto ms     = ToUnixMillis(tp);
  std::time_t secs  = static_cast<std::time_t>(ms / 1000);
  int         frac  = static_cast<int>(ms % 1000);
  if (frac < 0) {
    frac += 1000;
    --secs;
  }

  std::tm utc{};
  gmtime_r(&secs, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << frac << 'Z';
  return oss.str();
}

} // namespace syncq::util
