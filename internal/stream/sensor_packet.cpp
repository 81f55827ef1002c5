#include "sensor_packet.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace sensorweave::stream {

namespace {

int64_t ReadSigned(const uint8_t* p, std::size_t bytes) {
  uint64_t raw = 0;
  for (std::size_t i = 0; i < bytes; ++i) {
    raw |= static_cast<uint64_t>(p[i]) << (8 * i);
  }
  const unsigned shift = static_cast<unsigned>(64 - 8 * bytes);
  return static_cast<int64_t>(raw << shift) >> shift;
}

void WriteSigned(uint8_t* p, std::size_t bytes, int64_t value) {
  const auto raw = static_cast<uint64_t>(value);
  for (std::size_t i = 0; i < bytes; ++i) {
    p[i] = static_cast<uint8_t>((raw >> (8 * i)) & 0xff);
  }
}

int64_t ClampToBits(double value, uint32_t bits) {
  const double hi = std::ldexp(1.0, static_cast<int>(bits) - 1) - 1.0;
  const double lo = -std::ldexp(1.0, static_cast<int>(bits) - 1);
  return static_cast<int64_t>(std::llround(std::clamp(value, lo, hi)));
}

} // namespace

std::size_t BytesPerSample(SampleFormat format) {
  switch (format) {
    case SampleFormat::kInt16:
      return 2;
    case SampleFormat::kInt24:
      return 3;
    case SampleFormat::kInt32:
    case SampleFormat::kFloat32:
      return 4;
    case SampleFormat::kFloat64:
      return 8;
  }
  return 0;
}

uint32_t BitWidth(SampleFormat format) {
  return static_cast<uint32_t>(BytesPerSample(format) * 8);
}

const char* ToString(SampleFormat format) {
  switch (format) {
    case SampleFormat::kInt16:
      return "i16";
    case SampleFormat::kInt24:
      return "i24";
    case SampleFormat::kInt32:
      return "i32";
    case SampleFormat::kFloat32:
      return "f32";
    case SampleFormat::kFloat64:
      return "f64";
  }
  return "unknown";
}

std::optional<SampleFormat> ParseSampleFormat(std::string_view name) {
  if (name == "i16") return SampleFormat::kInt16;
  if (name == "i24") return SampleFormat::kInt24;
  if (name == "i32") return SampleFormat::kInt32;
  if (name == "f32") return SampleFormat::kFloat32;
  if (name == "f64") return SampleFormat::kFloat64;
  return std::nullopt;
}

bool IsKnownFormat(uint8_t raw) {
  return raw >= static_cast<uint8_t>(SampleFormat::kInt16) && raw <= static_cast<uint8_t>(SampleFormat::kFloat64);
}

SampleFormat FormatForBitDepth(uint32_t bit_depth) {
  if (bit_depth <= 16) return SampleFormat::kInt16;
  if (bit_depth <= 24) return SampleFormat::kInt24;
  if (bit_depth <= 32) return SampleFormat::kInt32;
  return SampleFormat::kFloat64;
}

std::size_t SensorPacket::ExpectedPayloadBytes() const {
  return static_cast<std::size_t>(sample_count) * channels * BytesPerSample(format);
}

uint64_t SensorPacket::SampleTimeNs(std::size_t i) const {
  if (sample_rate == 0) return timestamp_ns;
  return timestamp_ns + static_cast<uint64_t>(std::llround(static_cast<double>(i) * 1e9 / sample_rate));
}

std::vector<double> SensorPacket::Channel(uint8_t channel) const {
  if (channel >= channels) throw util::InvalidArgument("sensor packet: channel out of range");
  if (!payload || static_cast<std::size_t>(payload->size()) < ExpectedPayloadBytes()) {
    throw util::InvalidArgument("sensor packet: payload shorter than sample_count * channels");
  }

  const std::size_t width = BytesPerSample(format);
  const uint8_t*    data  = payload->data();

  std::vector<double> out(sample_count);
  for (std::size_t i = 0; i < sample_count; ++i) {
    const uint8_t* p = data + (i * channels + channel) * width;
    switch (format) {
      case SampleFormat::kInt16:
      case SampleFormat::kInt24:
      case SampleFormat::kInt32:
        out[i] = static_cast<double>(ReadSigned(p, width));
        break;
      case SampleFormat::kFloat32: {
        float v;
        std::memcpy(&v, p, sizeof(v));
        out[i] = v;
        break;
      }
      case SampleFormat::kFloat64: {
        double v;
        std::memcpy(&v, p, sizeof(v));
        out[i] = v;
        break;
      }
    }
  }
  return out;
}

std::shared_ptr<arrow::Buffer> EncodeSamples(const std::vector<double>& interleaved, SampleFormat format) {
  const std::size_t width  = BytesPerSample(format);
  auto              result = arrow::AllocateBuffer(static_cast<int64_t>(interleaved.size() * width));
  if (!result.ok()) throw std::runtime_error(result.status().ToString());

  std::shared_ptr<arrow::Buffer> buffer = std::move(*result);
  uint8_t*                       out    = buffer->mutable_data();

  for (std::size_t i = 0; i < interleaved.size(); ++i) {
    uint8_t* p = out + i * width;
    switch (format) {
      case SampleFormat::kInt16:
      case SampleFormat::kInt24:
      case SampleFormat::kInt32:
        WriteSigned(p, width, ClampToBits(interleaved[i], BitWidth(format)));
        break;
      case SampleFormat::kFloat32: {
        const auto v = static_cast<float>(interleaved[i]);
        std::memcpy(p, &v, sizeof(v));
        break;
      }
      case SampleFormat::kFloat64:
        std::memcpy(p, &interleaved[i], sizeof(double));
        break;
    }
  }
  return buffer;
}

} // namespace sensorweave::stream
