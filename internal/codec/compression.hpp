#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace arrow::util {
class Codec;
}

namespace syncq::codec {

// Wire ids stored in the codec tag. Never renumber.
enum class Algorithm : std::uint8_t {
  kIdentity = 0,
  kFast     = 1, // LZ4 frame
  kHigh     = 2, // Zstandard
};

std::string_view         ToString(Algorithm algorithm);
std::optional<Algorithm> AlgorithmFromId(std::uint8_t id);

/*
  Compressor

  One-shot block compression on top of arrow::util::Codec. Compressed
  frames carry the original length as an 8 byte little-endian prefix so
  decompression can size its buffer exactly.
*/
class Compressor {
 public:
  // level 0 selects each codec's default level
  explicit Compressor(int level = 0);
  ~Compressor();

  Compressor(const Compressor&)            = delete;
  Compressor& operator=(const Compressor&) = delete;

  std::string Compress(Algorithm algorithm, std::string_view input) const;
  std::string Decompress(Algorithm algorithm, std::string_view input) const;

 private:
  arrow::util::Codec& CodecFor(Algorithm algorithm) const;

  std::map<Algorithm, std::unique_ptr<arrow::util::Codec>> codecs_;
};

} // namespace syncq::codec
