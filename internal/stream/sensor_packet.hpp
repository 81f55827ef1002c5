#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sensorweave/v1/types.pb.h"

namespace sensorweave::stream {

// Sample encodings on the wire, little-endian, channels interleaved.
enum class SampleFormat : uint8_t {
  kInt16   = 1,
  kInt24   = 2,
  kInt32   = 3,
  kFloat32 = 4,
  kFloat64 = 5,
};

std::size_t                 BytesPerSample(SampleFormat format);
uint32_t                    BitWidth(SampleFormat format);
const char*                 ToString(SampleFormat format);
std::optional<SampleFormat> ParseSampleFormat(std::string_view name);
bool                        IsKnownFormat(uint8_t raw);

// Smallest format able to carry the given bit depth.
SampleFormat FormatForBitDepth(uint32_t bit_depth);

/*
  One block of samples from a bridge.

  Packets are shared read-only between the session channel and every
  consumer; the payload is an immutable Arrow buffer.
*/
struct SensorPacket {
  std::string                    stream_id;
  uint64_t                       timestamp_ns    = 0;
  sensorweave::v1::SyncSource    time_source     = sensorweave::v1::SYNC_SOURCE_LOCAL;
  uint8_t                        sync_confidence = 0;
  sensorweave::v1::SensingDomain domain          = sensorweave::v1::SENSING_DOMAIN_UNSPECIFIED;
  uint32_t                       sample_rate     = 0;
  uint16_t                       sample_count    = 0;
  SampleFormat                   format          = SampleFormat::kFloat32;
  uint8_t                        channels        = 1;
  uint64_t                       sequence        = 0;
  std::shared_ptr<arrow::Buffer> payload;

  std::size_t ExpectedPayloadBytes() const;

  // timestamp of sample i within the packet
  uint64_t SampleTimeNs(std::size_t i) const;

  // de-interleaves one channel into doubles
  std::vector<double> Channel(uint8_t channel) const;
};

using SensorPacketPtr = std::shared_ptr<const SensorPacket>;

// Encodes interleaved samples into a payload buffer of the given format.
std::shared_ptr<arrow::Buffer> EncodeSamples(const std::vector<double>& interleaved, SampleFormat format);

} // namespace sensorweave::stream
