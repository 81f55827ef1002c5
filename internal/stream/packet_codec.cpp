#include "packet_codec.hpp"

#include <limits>

#include "internal/util/errors.hpp"

namespace sensorweave::stream {

namespace {

template <typename T>
void PutLE(std::string& out, T value) {
  for (std::size_t i = 0; i < sizeof(T); ++i) {
    out.push_back(static_cast<char>((static_cast<uint64_t>(value) >> (8 * i)) & 0xff));
  }
}

class Reader {
 public:
  explicit Reader(std::string_view bytes) : bytes_(bytes) {
  }

  template <typename T>
  T Get(const char* field) {
    Need(sizeof(T), field);
    uint64_t value = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
      value |= static_cast<uint64_t>(static_cast<uint8_t>(bytes_[pos_ + i])) << (8 * i);
    }
    pos_ += sizeof(T);
    return static_cast<T>(value);
  }

  std::string_view Bytes(std::size_t n, const char* field) {
    Need(n, field);
    auto out = bytes_.substr(pos_, n);
    pos_ += n;
    return out;
  }

  std::size_t Remaining() const {
    return bytes_.size() - pos_;
  }

 private:
  void Need(std::size_t n, const char* field) const {
    if (bytes_.size() - pos_ < n) throw util::InvalidArgument(std::string("packet truncated at ") + field);
  }

  std::string_view bytes_;
  std::size_t      pos_ = 0;
};

} // namespace

std::string EncodePacket(const SensorPacket& packet) {
  if (packet.stream_id.size() > std::numeric_limits<uint16_t>::max()) throw util::InvalidArgument("encode packet: stream id too long");

  const std::size_t payload_len = packet.payload ? static_cast<std::size_t>(packet.payload->size()) : 0;
  if (payload_len != packet.ExpectedPayloadBytes()) {
    throw util::InvalidArgument("encode packet: payload length does not match sample_count * channels * width");
  }

  std::string out;
  out.reserve(40 + packet.stream_id.size() + payload_len);

  PutLE<uint32_t>(out, kPacketMagic);
  PutLE<uint8_t>(out, kPacketVersion);
  PutLE<uint16_t>(out, static_cast<uint16_t>(packet.stream_id.size()));
  out += packet.stream_id;
  PutLE<uint64_t>(out, packet.timestamp_ns);
  PutLE<uint8_t>(out, static_cast<uint8_t>(packet.time_source));
  PutLE<uint8_t>(out, packet.sync_confidence);
  PutLE<uint8_t>(out, static_cast<uint8_t>(packet.domain));
  PutLE<uint32_t>(out, packet.sample_rate);
  PutLE<uint16_t>(out, packet.sample_count);
  PutLE<uint8_t>(out, static_cast<uint8_t>(packet.format));
  PutLE<uint8_t>(out, packet.channels);
  PutLE<uint64_t>(out, packet.sequence);
  PutLE<uint32_t>(out, static_cast<uint32_t>(payload_len));
  if (payload_len > 0) out.append(reinterpret_cast<const char*>(packet.payload->data()), payload_len);
  return out;
}

SensorPacket DecodePacket(std::string_view bytes) {
  Reader in(bytes);

  if (in.Get<uint32_t>("magic") != kPacketMagic) throw util::InvalidArgument("decode packet: bad magic");
  if (const auto version = in.Get<uint8_t>("version"); version != kPacketVersion) {
    throw util::InvalidArgument("decode packet: unsupported version " + std::to_string(version));
  }

  SensorPacket packet;
  const auto   id_len = in.Get<uint16_t>("stream id length");
  packet.stream_id    = std::string(in.Bytes(id_len, "stream id"));
  packet.timestamp_ns = in.Get<uint64_t>("timestamp");

  const auto time_source = in.Get<uint8_t>("time source");
  if (!sensorweave::v1::SyncSource_IsValid(time_source)) throw util::InvalidArgument("decode packet: unknown time source");
  packet.time_source     = static_cast<sensorweave::v1::SyncSource>(time_source);
  packet.sync_confidence = in.Get<uint8_t>("sync confidence");

  const auto domain = in.Get<uint8_t>("domain");
  if (!sensorweave::v1::SensingDomain_IsValid(domain)) throw util::InvalidArgument("decode packet: unknown domain");
  packet.domain = static_cast<sensorweave::v1::SensingDomain>(domain);

  packet.sample_rate  = in.Get<uint32_t>("sample rate");
  packet.sample_count = in.Get<uint16_t>("sample count");

  const auto format = in.Get<uint8_t>("format");
  if (!IsKnownFormat(format)) throw util::InvalidArgument("decode packet: unknown sample format");
  packet.format   = static_cast<SampleFormat>(format);
  packet.channels = in.Get<uint8_t>("channels");
  if (packet.channels == 0) throw util::InvalidArgument("decode packet: zero channels");
  packet.sequence = in.Get<uint64_t>("sequence");

  const auto payload_len = in.Get<uint32_t>("payload length");
  if (payload_len != packet.ExpectedPayloadBytes()) {
    throw util::InvalidArgument("decode packet: payload length does not match sample_count * channels * width");
  }
  auto payload = in.Bytes(payload_len, "payload");
  if (in.Remaining() != 0) throw util::InvalidArgument("decode packet: trailing bytes");

  packet.payload = arrow::Buffer::FromString(std::string(payload));
  return packet;
}

} // namespace sensorweave::stream
