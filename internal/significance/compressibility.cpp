#include <arrow/util/compression.h>

#include <algorithm>
#include <numeric>
#include <random>
#include <string>

#include "battery.hpp"
#include "internal/util/errors.hpp"

namespace sensorweave::significance {

namespace {

constexpr uint32_t kLevels      = 16;
constexpr uint32_t kSurrogates  = 3;
constexpr uint32_t kShuffleSeed = 0x5357u;

int64_t CompressedSize(arrow::util::Codec& codec, const std::string& bytes) {
  const auto* input = reinterpret_cast<const uint8_t*>(bytes.data());
  const auto  len   = static_cast<int64_t>(bytes.size());

  std::string out(static_cast<std::size_t>(codec.MaxCompressedLen(len, input)), '\0');
  auto        written = codec.Compress(len, input, static_cast<int64_t>(out.size()), reinterpret_cast<uint8_t*>(out.data()));
  if (!written.ok()) throw util::InvalidState("compression failed: " + written.status().ToString());
  return *written;
}

// one byte per sample pair, a in the high nibble
std::string Interleave(const std::vector<uint32_t>& qa, const std::vector<uint32_t>& qb, const std::vector<std::size_t>& order) {
  std::string out;
  out.reserve(order.size());
  for (std::size_t i = 0; i < order.size(); ++i) out.push_back(static_cast<char>((qa[i] << 4) | qb[order[i]]));
  return out;
}

} // namespace

Compressibility MeasureCompressibility(const LaggedPair& pair, const std::string& codec_name) {
  auto type = arrow::util::Codec::GetCompressionType(codec_name);
  if (!type.ok()) throw util::InvalidArgument("unknown compression codec '" + codec_name + "': " + type.status().ToString());

  auto codec = arrow::util::Codec::Create(*type);
  if (!codec.ok()) throw util::InvalidState("compression codec unavailable: " + codec.status().ToString());

  const auto qa = Quantize(pair.a, kLevels);
  const auto qb = Quantize(pair.b, kLevels);

  std::vector<std::size_t> order(std::min(qa.size(), qb.size()));
  std::iota(order.begin(), order.end(), std::size_t{0});

  Compressibility out;
  out.size_joint = CompressedSize(**codec, Interleave(qa, qb, order));

  // Pairing a with shuffled b keeps both marginals and drops what they
  // share, so the surrogate costs what the two streams cost apart while
  // paying the frame overhead and symbol alphabet of the joint stream once.
  std::mt19937 rng(kShuffleSeed);
  int64_t      total = 0;
  for (uint32_t s = 0; s < kSurrogates; ++s) {
    std::shuffle(order.begin(), order.end(), rng);
    total += CompressedSize(**codec, Interleave(qa, qb, order));
  }
  out.size_separate = total / kSurrogates;
  return out;
}

} // namespace sensorweave::significance
