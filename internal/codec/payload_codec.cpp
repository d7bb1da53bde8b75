#include "payload_codec.hpp"

#include <sodium.h>

#include <charconv>
#include <stdexcept>
#include <vector>

#include "internal/util/errors.hpp"

namespace syncq::codec {

namespace {

constexpr std::size_t kNonceBytes = crypto_aead_xchacha20poly1305_ietf_NPUBBYTES;
constexpr std::size_t kMacBytes   = crypto_aead_xchacha20poly1305_ietf_ABYTES;

template <typename T>
bool ParseNumber(std::string_view text, T& out) {
  unsigned value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size() || value > 0xFF) return false;
  out = static_cast<T>(value);
  return true;
}

const unsigned char* Bytes(std::string_view s) {
  return reinterpret_cast<const unsigned char*>(s.data());
}

} // namespace

std::string CodecTag::Serialize() const {
  return std::to_string(algorithm_id) + ":" + key_fingerprint + ":" + std::to_string(nonce_length);
}

CodecTag CodecTag::Parse(std::string_view text) {
  const auto first = text.find(':');
  const auto last  = text.rfind(':');
  if (first == std::string_view::npos || first == last) {
    throw util::CorruptPayload("malformed codec tag: " + std::string(text));
  }

  CodecTag tag;
  tag.key_fingerprint = std::string(text.substr(first + 1, last - first - 1));
  if (!ParseNumber(text.substr(0, first), tag.algorithm_id) || !ParseNumber(text.substr(last + 1), tag.nonce_length) ||
      tag.key_fingerprint.empty()) {
    throw util::CorruptPayload("malformed codec tag: " + std::string(text));
  }
  return tag;
}

PayloadCodec::PayloadCodec(std::shared_ptr<KeySource> keys, CodecOptions options)
    : keys_(std::move(keys)), options_(options), compressor_(options.compression_level) {
  if (sodium_init() < 0) {
    throw std::runtime_error("libsodium init failed");
  }
  if (!keys_) {
    throw std::invalid_argument("PayloadCodec requires a KeySource");
  }
}

EncodedPayload PayloadCodec::Encode(std::string_view plaintext) const {
  EncodedPayload out;
  out.plaintext_size = plaintext.size();

  Algorithm   algorithm = Algorithm::kIdentity;
  std::string body;
  try {
    if (options_.algorithm != Algorithm::kIdentity && plaintext.size() >= options_.compression_threshold) {
      body      = compressor_.Compress(options_.algorithm, plaintext);
      algorithm = options_.algorithm;
      if (body.size() >= plaintext.size()) {
        // incompressible input: store it as is
        body      = std::string(plaintext);
        algorithm = Algorithm::kIdentity;
      }
    } else {
      body = std::string(plaintext);
    }
  } catch (const util::CodecError& e) {
    throw util::EncodeError(std::string("compression failed: ") + e.what());
  }
  out.compressed_size = body.size();

  auto key = keys_->Current();

  CodecTag tag;
  tag.algorithm_id    = static_cast<std::uint8_t>(algorithm);
  tag.key_fingerprint = key.fingerprint;
  tag.nonce_length    = static_cast<std::uint8_t>(kNonceBytes);
  out.tag             = tag.Serialize();

  std::string bytes(1 + kNonceBytes + body.size() + kMacBytes, '\0');
  bytes[0]    = static_cast<char>(kPayloadVersion);
  auto* nonce = reinterpret_cast<unsigned char*>(bytes.data() + 1);
  randombytes_buf(nonce, kNonceBytes);

  unsigned long long clen = 0;
  const int          rc   = crypto_aead_xchacha20poly1305_ietf_encrypt(reinterpret_cast<unsigned char*>(bytes.data() + 1 + kNonceBytes), &clen,
                                                                         Bytes(body), body.size(), Bytes(out.tag), out.tag.size(), nullptr, nonce,
                                                                         key.key.data());
  sodium_memzero(key.key.data(), key.key.size());
  sodium_memzero(body.data(), body.size());
  if (rc != 0) {
    throw util::EncodeError("payload encryption failed");
  }

  bytes.resize(1 + kNonceBytes + static_cast<std::size_t>(clen));
  out.bytes = std::move(bytes);
  return out;
}

std::string PayloadCodec::Decode(std::string_view bytes, std::string_view tag_text) const {
  const auto tag       = CodecTag::Parse(tag_text);
  const auto algorithm = AlgorithmFromId(tag.algorithm_id);
  if (!algorithm) {
    throw util::AlgoUnknown("unknown compression algorithm id " + std::to_string(tag.algorithm_id));
  }

  if (bytes.empty() || static_cast<std::uint8_t>(bytes[0]) != kPayloadVersion) {
    throw util::CorruptPayload("unsupported payload version");
  }
  if (tag.nonce_length != kNonceBytes) {
    throw util::CorruptPayload("unexpected nonce length " + std::to_string(tag.nonce_length));
  }
  if (bytes.size() < 1 + kNonceBytes + kMacBytes) {
    throw util::CorruptPayload("payload shorter than nonce and tag");
  }

  auto key = keys_->Resolve(tag.key_fingerprint);
  if (!key) {
    throw util::KeyMismatch("no key for fingerprint " + tag.key_fingerprint);
  }

  const auto* nonce      = Bytes(bytes.substr(1, kNonceBytes));
  const auto  ciphertext = bytes.substr(1 + kNonceBytes);

  std::string        body(ciphertext.size() - kMacBytes, '\0');
  unsigned long long plen = 0;
  const int rc = crypto_aead_xchacha20poly1305_ietf_decrypt(reinterpret_cast<unsigned char*>(body.data()), &plen, nullptr, Bytes(ciphertext),
                                                            ciphertext.size(), Bytes(tag_text), tag_text.size(), nonce, key->data());
  sodium_memzero(key->data(), key->size());
  if (rc != 0) {
    throw util::AuthFailure("payload authentication failed");
  }
  body.resize(static_cast<std::size_t>(plen));

  return compressor_.Decompress(*algorithm, body);
}

} // namespace syncq::codec
