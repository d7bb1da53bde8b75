#include "uuid.hpp"

#include <cctype>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>
#include <stdexcept>

namespace syncq::util {

namespace {

std::mutex    g_mutex;
std::uint64_t g_last_ms  = 0;
std::uint16_t g_sequence = 0;

constexpr std::uint16_t kSequenceMask = 0x0FFF;

} // namespace

UUID GenerateUUIDv7(TimePoint now) {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  const auto    wall = ToUnixMillis(now);
  std::uint64_t ms   = wall < 0 ? 0 : static_cast<std::uint64_t>(wall);
  std::uint16_t seq  = 0;

  {
    std::lock_guard lock(g_mutex);
    if (ms <= g_last_ms) {
      // same or earlier millisecond: stay on the last timestamp and count up
      ms = g_last_ms;
      if (g_sequence == kSequenceMask) {
        ++ms;
        g_sequence = 0;
      } else {
        ++g_sequence;
      }
    } else {
      g_sequence = 0;
    }
    g_last_ms = ms;
    seq       = g_sequence;
  }

  UUID id{};
  for (int i = 0; i < 6; ++i)
    id[i] = static_cast<std::uint8_t>(ms >> (40 - 8 * i));

  id[6] = static_cast<std::uint8_t>(0x70 | ((seq >> 8) & 0x0F));
  id[7] = static_cast<std::uint8_t>(seq & 0xFF);

  std::uint64_t tail = rng();
  for (size_t i = 8; i < id.size(); ++i) {
    id[i] = static_cast<std::uint8_t>(tail);
    tail >>= 8;
  }

  // RFC variant bits
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToString(const UUID& id) {
  std::ostringstream oss;

  for (size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) oss << "-";
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(id[i]);
  }
  return oss.str();
}

UUID FromString(const std::string& str) {
  UUID        id{};
  std::string hex;

  for (char c : str)
    if (c != '-') hex += c;

  if (hex.size() != 32)
    throw std::invalid_argument("invalid UUID string: " + str);

  for (size_t i = 0; i < 16; ++i) {
    const auto byte = hex.substr(i * 2, 2);
    if (!std::isxdigit(static_cast<unsigned char>(byte[0])) || !std::isxdigit(static_cast<unsigned char>(byte[1])))
      throw std::invalid_argument("invalid UUID string: " + str);
    id[i] = static_cast<std::uint8_t>(std::stoul(byte, nullptr, 16));
  }

  return id;
}

} // namespace syncq::util
