#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "sensor_packet.hpp"

namespace sensorweave::stream {

inline constexpr uint32_t kPacketMagic   = 0x53575631; // "SWV1"
inline constexpr uint8_t  kPacketVersion = 1;

/*
  Wire layout, little-endian:

    u32  magic
    u8   version
    u16  stream id length
    ...  stream id bytes
    u64  timestamp_ns
    u8   time source
    u8   sync confidence
    u8   domain
    u32  sample rate
    u16  sample count
    u8   format
    u8   channels
    u64  sequence
    u32  payload length
    ...  payload
*/
std::string EncodePacket(const SensorPacket& packet);

// throws util::InvalidArgument on malformed input
SensorPacket DecodePacket(std::string_view bytes);

} // namespace sensorweave::stream
