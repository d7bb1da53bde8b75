#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/item.hpp"

namespace syncq::worker {

struct OutboundItem {
  model::ItemId   id{};
  std::string     payload; // plaintext
  std::uint32_t   attempts = 0;
  model::Priority priority = model::Priority::kNormal;
};

struct ForwardResult {
  enum class Kind : std::uint8_t {
    kOk,
    kRetryable,
    kNonRetryable,
    kAuth,
    kTimeout,
  };

  Kind        kind = Kind::kOk;
  std::string reason;

  static ForwardResult Ok() {
    return {Kind::kOk, {}};
  }
  static ForwardResult Retryable(std::string reason) {
    return {Kind::kRetryable, std::move(reason)};
  }
  static ForwardResult NonRetryable(std::string reason) {
    return {Kind::kNonRetryable, std::move(reason)};
  }
  static ForwardResult Auth() {
    return {Kind::kAuth, {}};
  }
  static ForwardResult Timeout() {
    return {Kind::kTimeout, {}};
  }
};

/*
  Transport that delivers a batch upstream.

  The result vector must match the input in length and order. An
  exception or a mismatched length makes every item of the batch
  Retryable.
*/
class Forwarder {
 public:
  virtual ~Forwarder() = default;

  virtual std::vector<ForwardResult> SendBatch(const std::vector<OutboundItem>& items) = 0;
};

} // namespace syncq::worker
