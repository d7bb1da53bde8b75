#include "compression.hpp"

#include <arrow/result.h>
#include <arrow/status.h>
#include <arrow/util/compression.h>

#include "internal/util/errors.hpp"

namespace syncq::codec {

namespace {

constexpr std::size_t kLengthPrefix = 8;

// decompressed payloads larger than this are treated as corrupt frames
constexpr std::uint64_t kMaxDecompressedBytes = 256ull * 1024 * 1024;

template <typename T>
T Unwrap(arrow::Result<T> result, const char* what) {
  if (!result.ok()) throw util::CodecError(std::string(what) + ": " + result.status().ToString());
  return std::move(result).ValueOrDie();
}

arrow::Compression::type ToArrow(Algorithm algorithm) {
  switch (algorithm) {
    case Algorithm::kFast:
      return arrow::Compression::LZ4_FRAME;
    case Algorithm::kHigh:
      return arrow::Compression::ZSTD;
    case Algorithm::kIdentity:
      break;
  }
  return arrow::Compression::UNCOMPRESSED;
}

void PutLength(std::string& out, std::uint64_t length) {
  for (std::size_t i = 0; i < kLengthPrefix; ++i) {
    out[i] = static_cast<char>((length >> (8 * i)) & 0xFF);
  }
}

std::uint64_t GetLength(std::string_view in) {
  std::uint64_t length = 0;
  for (std::size_t i = 0; i < kLengthPrefix; ++i) {
    length |= static_cast<std::uint64_t>(static_cast<unsigned char>(in[i])) << (8 * i);
  }
  return length;
}

} // namespace

std::string_view ToString(Algorithm algorithm) {
  switch (algorithm) {
    case Algorithm::kIdentity:
      return "identity";
    case Algorithm::kFast:
      return "lz4";
    case Algorithm::kHigh:
      return "zstd";
  }
  return "unknown";
}

std::optional<Algorithm> AlgorithmFromId(std::uint8_t id) {
  switch (id) {
    case 0:
      return Algorithm::kIdentity;
    case 1:
      return Algorithm::kFast;
    case 2:
      return Algorithm::kHigh;
    default:
      return std::nullopt;
  }
}

Compressor::Compressor(int level) {
  const int arrow_level = level > 0 ? level : arrow::util::kUseDefaultCompressionLevel;
  for (auto algorithm : {Algorithm::kFast, Algorithm::kHigh}) {
    codecs_.emplace(algorithm, Unwrap(arrow::util::Codec::Create(ToArrow(algorithm), arrow_level), "create codec"));
  }
}

Compressor::~Compressor() = default;

arrow::util::Codec& Compressor::CodecFor(Algorithm algorithm) const {
  auto it = codecs_.find(algorithm);
  if (it == codecs_.end()) {
    throw util::AlgoUnknown("no codec for algorithm " + std::to_string(static_cast<int>(algorithm)));
  }
  return *it->second;
}

std::string Compressor::Compress(Algorithm algorithm, std::string_view input) const {
  if (algorithm == Algorithm::kIdentity) return std::string(input);

  auto&       codec = CodecFor(algorithm);
  const auto* data  = reinterpret_cast<const std::uint8_t*>(input.data());
  const auto  size  = static_cast<std::int64_t>(input.size());

  const auto  max_len = codec.MaxCompressedLen(size, data);
  std::string out(kLengthPrefix + static_cast<std::size_t>(max_len), '\0');
  PutLength(out, input.size());

  auto* dst     = reinterpret_cast<std::uint8_t*>(out.data() + kLengthPrefix);
  auto  written = Unwrap(codec.Compress(size, data, max_len, dst), "compress");
  out.resize(kLengthPrefix + static_cast<std::size_t>(written));
  return out;
}

std::string Compressor::Decompress(Algorithm algorithm, std::string_view input) const {
  if (algorithm == Algorithm::kIdentity) return std::string(input);

  if (input.size() < kLengthPrefix) {
    throw util::CorruptPayload("compressed frame shorter than its length prefix");
  }
  const auto length = GetLength(input);
  if (length > kMaxDecompressedBytes) {
    throw util::CorruptPayload("compressed frame declares " + std::to_string(length) + " bytes");
  }

  auto&       codec = CodecFor(algorithm);
  std::string out(static_cast<std::size_t>(length), '\0');
  if (length == 0) return out;

  const auto* src      = reinterpret_cast<const std::uint8_t*>(input.data() + kLengthPrefix);
  const auto  src_size = static_cast<std::int64_t>(input.size() - kLengthPrefix);
  auto        produced = codec.Decompress(src_size, src, static_cast<std::int64_t>(length), reinterpret_cast<std::uint8_t*>(out.data()));
  if (!produced.ok()) {
    throw util::CorruptPayload("decompress: " + produced.status().ToString());
  }
  if (static_cast<std::uint64_t>(*produced) != length) {
    throw util::CorruptPayload("decompressed length does not match frame header");
  }
  return out;
}

} // namespace syncq::codec
