#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "internal/clock/clock.hpp"
#include "key_source.hpp"

namespace syncq::codec {

/*
  In-process KeySource with rotation.

  Rotate() promotes a new current key; the previous one stays resolvable
  until now + grace on the injected clock. Key bytes are wiped when they
  are dropped.
*/
class Keyring final : public KeySource {
 public:
  Keyring(const Key& current, std::shared_ptr<clock::Clock> clock);
  ~Keyring() override;

  Keyring(const Keyring&)            = delete;
  Keyring& operator=(const Keyring&) = delete;

  KeyMaterial        Current() const override;
  std::optional<Key> Resolve(const std::string& fingerprint) const override;

  void Rotate(const Key& next, clock::Duration grace);

  // keep an older key resolvable until now + grace without making it current
  void AddRetired(const Key& key, clock::Duration grace);

  // drop retired keys past their grace period; returns how many were wiped
  std::size_t PruneExpired();

  // hex of the first 8 bytes of BLAKE2b(key)
  static std::string Fingerprint(const Key& key);

  static Key ParseHexKey(const std::string& hex);

  /*
    Reads one hex encoded 32 byte key per line; the first line is the
    current key and the rest are retired keys kept for grace.
    Blank lines and lines starting with '#' are skipped.
  */
  static std::shared_ptr<Keyring> LoadFromFile(const std::string& path, std::shared_ptr<clock::Clock> clock, clock::Duration grace);

 private:
  struct Retired {
    Key              key{};
    clock::TimePoint expires_at{};
  };

  std::shared_ptr<clock::Clock> clock_;

  mutable std::mutex             mutex_;
  KeyMaterial                    current_;
  std::map<std::string, Retired> retired_;
};

} // namespace syncq::codec
