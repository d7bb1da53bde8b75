#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "internal/clock/manual_clock.hpp"
#include "internal/codec/compression.hpp"
#include "internal/codec/keyring.hpp"
#include "internal/codec/payload_codec.hpp"
#include "internal/util/errors.hpp"

namespace {

using syncq::clock::ManualClock;
using syncq::codec::Algorithm;
using syncq::codec::CodecOptions;
using syncq::codec::CodecTag;
using syncq::codec::Key;
using syncq::codec::Keyring;
using syncq::codec::PayloadCodec;
using syncq::util::Duration;

Key MakeKey(std::uint8_t seed) {
  Key key{};
  for (std::size_t i = 0; i < key.size(); ++i) key[i] = static_cast<std::uint8_t>(seed + i);
  return key;
}

std::string Compressible() {
  std::string text;
  for (int i = 0; i < 200; ++i) text += "sensor=42 reading=17.5 status=ok;";
  return text;
}

template <typename E, typename F>
bool Throws(F&& f) {
  try {
    f();
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestCompressorRoundTripsEveryAlgorithm() {
  syncq::codec::Compressor compressor;
  const auto               text = Compressible();

  for (auto algorithm : {Algorithm::kIdentity, Algorithm::kFast, Algorithm::kHigh}) {
    const auto packed = compressor.Compress(algorithm, text);
    assert(compressor.Decompress(algorithm, packed) == text);
    if (algorithm != Algorithm::kIdentity) assert(packed.size() < text.size());
  }

  assert(compressor.Decompress(Algorithm::kFast, compressor.Compress(Algorithm::kFast, "")).empty());
  assert(Throws<syncq::util::CorruptPayload>([&] { compressor.Decompress(Algorithm::kHigh, "abc"); }));

  assert(syncq::codec::AlgorithmFromId(2) == Algorithm::kHigh);
  assert(!syncq::codec::AlgorithmFromId(9).has_value());
}

void TestCodecTagFormat() {
  CodecTag tag;
  tag.algorithm_id    = 1;
  tag.key_fingerprint = "3fa0c2d41b9e7788";
  tag.nonce_length    = 24;
  assert(tag.Serialize() == "1:3fa0c2d41b9e7788:24");

  const auto parsed = CodecTag::Parse("2:abcd:24");
  assert(parsed.algorithm_id == 2 && parsed.key_fingerprint == "abcd" && parsed.nonce_length == 24);

  assert(Throws<syncq::util::CorruptPayload>([] { CodecTag::Parse("garbage"); }));
  assert(Throws<syncq::util::CorruptPayload>([] { CodecTag::Parse("1::24"); }));
  assert(Throws<syncq::util::CorruptPayload>([] { CodecTag::Parse("x:ab:24"); }));
}

void TestEncodeHidesPlaintextAndDecodes() {
  auto clock = std::make_shared<ManualClock>();
  auto keys  = std::make_shared<Keyring>(MakeKey(1), clock);

  CodecOptions options;
  options.algorithm             = Algorithm::kFast;
  options.compression_threshold = 64;
  PayloadCodec codec(keys, options);

  const auto text    = Compressible();
  const auto encoded = codec.Encode(text);
  assert(encoded.bytes.find("sensor=42") == std::string::npos);
  assert(encoded.compressed_size < encoded.plaintext_size);
  assert(CodecTag::Parse(encoded.tag).algorithm_id == static_cast<std::uint8_t>(Algorithm::kFast));
  assert(codec.Decode(encoded.bytes, encoded.tag) == text);

  // below the threshold nothing is compressed
  const auto small = codec.Encode("tiny");
  assert(CodecTag::Parse(small.tag).algorithm_id == static_cast<std::uint8_t>(Algorithm::kIdentity));
  assert(codec.Decode(small.bytes, small.tag) == "tiny");

  // fresh nonce per encode
  assert(codec.Encode("tiny").bytes != small.bytes);
}

void TestIncompressibleInputStaysIdentity() {
  auto clock = std::make_shared<ManualClock>();
  auto keys  = std::make_shared<Keyring>(MakeKey(1), clock);

  CodecOptions options;
  options.algorithm = Algorithm::kHigh;
  PayloadCodec codec(keys, options);

  std::string noise;
  std::uint32_t x = 2463534242u;
  for (int i = 0; i < 256; ++i) {
    x ^= x << 13;
    x ^= x >> 17;
    x ^= x << 5;
    noise.push_back(static_cast<char>(x & 0xFF));
  }

  const auto encoded = codec.Encode(noise);
  assert(CodecTag::Parse(encoded.tag).algorithm_id == static_cast<std::uint8_t>(Algorithm::kIdentity));
  assert(codec.Decode(encoded.bytes, encoded.tag) == noise);
}

void TestTamperingFailsAuthentication() {
  auto         clock = std::make_shared<ManualClock>();
  auto         keys  = std::make_shared<Keyring>(MakeKey(1), clock);
  PayloadCodec codec(keys, CodecOptions{});

  const auto encoded = codec.Encode("payload body");

  auto flipped = encoded.bytes;
  flipped[flipped.size() - 1] ^= 0x01;
  assert(Throws<syncq::util::AuthFailure>([&] { codec.Decode(flipped, encoded.tag); }));

  // the tag is bound as associated data
  auto tag = CodecTag::Parse(encoded.tag);
  tag.algorithm_id = static_cast<std::uint8_t>(Algorithm::kFast);
  assert(Throws<syncq::util::AuthFailure>([&] { codec.Decode(encoded.bytes, tag.Serialize()); }));

  tag.algorithm_id = 7;
  assert(Throws<syncq::util::AlgoUnknown>([&] { codec.Decode(encoded.bytes, tag.Serialize()); }));

  auto bad_version = encoded.bytes;
  bad_version[0]   = 9;
  assert(Throws<syncq::util::CorruptPayload>([&] { codec.Decode(bad_version, encoded.tag); }));

  assert(Throws<syncq::util::CorruptPayload>([&] { codec.Decode(encoded.bytes.substr(0, 10), encoded.tag); }));
}

void TestKeyRotationGrace() {
  auto         clock = std::make_shared<ManualClock>();
  auto         keys  = std::make_shared<Keyring>(MakeKey(1), clock);
  PayloadCodec codec(keys, CodecOptions{});

  const auto old_fingerprint = keys->Current().fingerprint;
  const auto before          = codec.Encode("written under the old key");

  keys->Rotate(MakeKey(100), Duration(60000));
  assert(keys->Current().fingerprint != old_fingerprint);
  assert(keys->Current().fingerprint == Keyring::Fingerprint(MakeKey(100)));

  const auto after = codec.Encode("written under the new key");
  assert(CodecTag::Parse(after.tag).key_fingerprint == keys->Current().fingerprint);

  clock->Advance(Duration(59999));
  assert(codec.Decode(before.bytes, before.tag) == "written under the old key");

  clock->Advance(Duration(1));
  assert(Throws<syncq::util::KeyMismatch>([&] { codec.Decode(before.bytes, before.tag); }));
  assert(codec.Decode(after.bytes, after.tag) == "written under the new key");

  assert(keys->PruneExpired() == 1);
  assert(keys->PruneExpired() == 0);
}

void TestKeyringFile() {
  const auto path = std::filesystem::temp_directory_path() / "syncq_codec_test.keys";
  {
    std::ofstream out(path);
    out << "# current first\n"
        << "0101010101010101010101010101010101010101010101010101010101010101\n"
        << "\n"
        << "0202020202020202020202020202020202020202020202020202020202020202\n";
  }

  auto clock = std::make_shared<ManualClock>();
  auto keys  = Keyring::LoadFromFile(path.string(), clock, Duration(1000));

  Key current{};
  current.fill(0x01);
  Key retired{};
  retired.fill(0x02);

  assert(keys->Current().fingerprint == Keyring::Fingerprint(current));
  assert(keys->Resolve(Keyring::Fingerprint(retired)).has_value());
  assert(Keyring::Fingerprint(current).size() == 16);

  std::filesystem::remove(path);

  assert(Throws<std::invalid_argument>([] { Keyring::ParseHexKey("abcd"); }));
  assert(Throws<std::runtime_error>([&] { Keyring::LoadFromFile("/nonexistent/syncq.keys", clock, Duration(1000)); }));
}

} // namespace

int main() {
  TestCompressorRoundTripsEveryAlgorithm();
  TestCodecTagFormat();
  TestEncodeHidesPlaintextAndDecodes();
  TestIncompressibleInputStaysIdentity();
  TestTamperingFailsAuthentication();
  TestKeyRotationGrace();
  TestKeyringFile();

  std::cout << "syncq_unit_codec: pass\n";
  return 0;
}
