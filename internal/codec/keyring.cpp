#include "keyring.hpp"

#include <sodium.h>

#include <fstream>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace syncq::codec {

namespace {

std::string Hex(const std::uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(kHex[(data[i] >> 4) & 0x0F]);
    out.push_back(kHex[data[i] & 0x0F]);
  }
  return out;
}

void Wipe(Key& key) {
  sodium_memzero(key.data(), key.size());
}

} // namespace

Keyring::Keyring(const Key& current, std::shared_ptr<clock::Clock> clock) : clock_(std::move(clock)) {
  if (sodium_init() < 0) {
    throw std::runtime_error("libsodium init failed");
  }
  current_.key         = current;
  current_.fingerprint = Fingerprint(current);
}

Keyring::~Keyring() {
  Wipe(current_.key);
  for (auto& [_, retired] : retired_) {
    Wipe(retired.key);
  }
}

KeyMaterial Keyring::Current() const {
  std::lock_guard lock(mutex_);
  return current_;
}

std::optional<Key> Keyring::Resolve(const std::string& fingerprint) const {
  std::lock_guard lock(mutex_);
  if (fingerprint == current_.fingerprint) return current_.key;

  auto it = retired_.find(fingerprint);
  if (it == retired_.end()) return std::nullopt;
  if (clock_->Now() >= it->second.expires_at) return std::nullopt;
  return it->second.key;
}

void Keyring::Rotate(const Key& next, clock::Duration grace) {
  const auto fingerprint = Fingerprint(next);
  const auto expires_at  = clock_->Now() + grace;

  std::lock_guard lock(mutex_);
  if (fingerprint == current_.fingerprint) return;

  retired_[current_.fingerprint] = Retired{current_.key, expires_at};
  Wipe(current_.key);

  auto it = retired_.find(fingerprint);
  if (it != retired_.end()) {
    Wipe(it->second.key);
    retired_.erase(it);
  }

  current_.key         = next;
  current_.fingerprint = fingerprint;

  SYNCQ_LOG_INFO("payload key rotated", {observability::StringField("fingerprint", fingerprint),
                                         observability::IntField("grace_ms", grace.count())});
}

void Keyring::AddRetired(const Key& key, clock::Duration grace) {
  const auto fingerprint = Fingerprint(key);
  const auto expires_at  = clock_->Now() + grace;

  std::lock_guard lock(mutex_);
  if (fingerprint == current_.fingerprint) return;
  retired_[fingerprint] = Retired{key, expires_at};
}

std::size_t Keyring::PruneExpired() {
  const auto now = clock_->Now();

  std::lock_guard lock(mutex_);
  std::size_t     pruned = 0;
  for (auto it = retired_.begin(); it != retired_.end();) {
    if (now >= it->second.expires_at) {
      Wipe(it->second.key);
      it = retired_.erase(it);
      ++pruned;
    } else {
      ++it;
    }
  }
  return pruned;
}

std::string Keyring::Fingerprint(const Key& key) {
  std::array<std::uint8_t, crypto_generichash_BYTES> digest{};
  crypto_generichash(digest.data(), digest.size(), key.data(), key.size(), nullptr, 0);
  return Hex(digest.data(), 8);
}

Key Keyring::ParseHexKey(const std::string& hex) {
  Key    key{};
  size_t bin_len = 0;
  if (sodium_hex2bin(key.data(), key.size(), hex.c_str(), hex.size(), nullptr, &bin_len, nullptr) != 0 || bin_len != key.size()) {
    Wipe(key);
    throw std::invalid_argument("key must be 64 hex characters");
  }
  return key;
}

std::shared_ptr<Keyring> Keyring::LoadFromFile(const std::string& path, std::shared_ptr<clock::Clock> clock, clock::Duration grace) {
  if (sodium_init() < 0) {
    throw std::runtime_error("libsodium init failed");
  }

  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot open keyring file: " + path);
  }

  std::shared_ptr<Keyring> keyring;
  std::string              line;
  while (std::getline(in, line)) {
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) line.pop_back();
    if (line.empty() || line.front() == '#') continue;

    auto key = ParseHexKey(line);
    if (!keyring) {
      keyring = std::make_shared<Keyring>(key, clock);
    } else {
      keyring->AddRetired(key, grace);
    }
    Wipe(key);
    sodium_memzero(line.data(), line.size());
  }

  if (!keyring) {
    throw std::runtime_error("keyring file has no keys: " + path);
  }
  return keyring;
}

} // namespace syncq::codec
