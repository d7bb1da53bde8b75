#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace syncq::codec {

using Key = std::array<std::uint8_t, 32>;

struct KeyMaterial {
  Key         key{};
  std::string fingerprint;
};

/*
  Source of payload encryption keys.

  Current() is used for every new encode. Resolve() must keep answering
  for fingerprints of stored items as long as the key is within its
  rotation grace period; std::nullopt means the key is gone.
*/
class KeySource {
 public:
  virtual ~KeySource() = default;

  virtual KeyMaterial        Current() const                                = 0;
  virtual std::optional<Key> Resolve(const std::string& fingerprint) const = 0;
};

} // namespace syncq::codec
