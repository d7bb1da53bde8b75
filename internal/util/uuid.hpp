#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "internal/util/time.hpp"

namespace syncq::util {

/*
  UUID helpers

  Item ids are raw 16 byte RFC 9562 version 7 UUIDs: a 48 bit unix
  millisecond prefix followed by a per-process sequence and random bits.
  Ids generated by one process sort in generation order, which gives the
  id tie-break for items enqueued in the same millisecond.
*/

using UUID = std::array<std::uint8_t, 16>;

UUID GenerateUUIDv7(TimePoint now);

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

} // namespace syncq::util
