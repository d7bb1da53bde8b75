#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "compression.hpp"
#include "key_source.hpp"

namespace syncq::codec {

// Leading byte of every stored payload blob.
inline constexpr std::uint8_t kPayloadVersion = 1;

/*
  Codec tag persisted next to the payload, e.g. "1:3fa0c2d41b9e7788:24".

  The serialized tag is bound into the AEAD as associated data, so a tag
  edited in the store fails authentication rather than decoding with the
  wrong parameters.
*/
struct CodecTag {
  std::uint8_t algorithm_id = 0;
  std::string  key_fingerprint;
  std::uint8_t nonce_length = 0;

  std::string     Serialize() const;
  static CodecTag Parse(std::string_view text);
};

struct EncodedPayload {
  std::string bytes; // version byte + nonce + ciphertext
  std::string tag;
  std::size_t plaintext_size  = 0;
  std::size_t compressed_size = 0;
};

struct CodecOptions {
  // algorithm used at or above the threshold
  Algorithm   algorithm             = Algorithm::kIdentity;
  std::size_t compression_threshold = 0;
  int         compression_level     = 0;
};

/*
  PayloadCodec

  encode: compress (when the payload reaches the threshold and compression
  actually shrinks it), then XChaCha20-Poly1305 with the KeySource's
  current key.

  decode: inverse. Throws util::AlgoUnknown, util::KeyMismatch,
  util::AuthFailure or util::CorruptPayload.
*/
class PayloadCodec {
 public:
  PayloadCodec(std::shared_ptr<KeySource> keys, CodecOptions options);

  EncodedPayload Encode(std::string_view plaintext) const;
  std::string    Decode(std::string_view bytes, std::string_view tag) const;

  const CodecOptions& Options() const {
    return options_;
  }

 private:
  std::shared_ptr<KeySource> keys_;
  CodecOptions               options_;
  Compressor                 compressor_;
};

} // namespace syncq::codec
