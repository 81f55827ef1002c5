#pragma once

#include <functional>
#include <string>

#include "sensor_packet.hpp"
#include "sync.hpp"
#include "sensorweave/v1/types.pb.h"

namespace sensorweave::stream {

enum class FlowControl {
  kPause,
  kResume,
};

struct OpenRequest {
  std::string                       session_id;
  sensorweave::v1::BridgeCapability capability;
  std::string                       stream_spec;
  uint32_t                          sample_rate = 0;
  uint32_t                          channels    = 1;
  SampleFormat                      format      = SampleFormat::kFloat32;
  sensorweave::v1::Transport        transport   = sensorweave::v1::TRANSPORT_UNSPECIFIED;
  SyncQuality                       sync;
  // per-packet bounds; zero leaves a bound open
  uint8_t min_sync_confidence = 0;
  int64_t max_drift_ns        = 0;
};

using PacketSink = std::function<void(SensorPacketPtr)>;

/*
  Agent messaging layer as seen by the session manager.

  Open wires the bridge's packets into sink and returns once the stream
  is established; failures raise util::StreamError (kTimeout when the
  bridge does not answer). Reconnect re-establishes a dropped stream on
  the same sink and returns false when this attempt failed.
*/
class BridgeConnector {
 public:
  virtual ~BridgeConnector() = default;

  virtual void Open(const OpenRequest& request, PacketSink sink) = 0;
  virtual void SendFlowControl(const std::string& session_id, FlowControl signal) = 0;
  virtual void Close(const std::string& session_id) = 0;
  virtual bool Reconnect(const OpenRequest& request) = 0;
};

} // namespace sensorweave::stream
