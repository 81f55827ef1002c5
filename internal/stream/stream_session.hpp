#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "bounded_channel.hpp"
#include "bridge_connector.hpp"
#include "bridge_uri.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "sensor_packet.hpp"
#include "session_state.hpp"

namespace sensorweave::runtime::config {
class SessionConfig;
}

namespace sensorweave::stream {

struct SessionOptions {
  uint32_t                  sequence_gap_tolerance = 8;
  std::size_t               channel_capacity       = 1024;
  double                    high_watermark         = 0.8;
  double                    low_watermark          = 0.25;
  std::chrono::milliseconds overrun_timeout{2000};
  std::chrono::milliseconds idle_timeout{30000};
  uint32_t                  max_reconnect_attempts = 5;
  std::chrono::milliseconds reconnect_base_backoff{100};
  std::chrono::milliseconds reconnect_max_backoff{5000};
  std::chrono::nanoseconds  max_sync_drift{1'000'000};
  bool                      auto_recover = true;

  static SessionOptions FromConfig(const sensorweave::runtime::config::SessionConfig& config);
};

struct SessionStats {
  uint64_t delivered      = 0;
  uint64_t out_of_order   = 0;
  uint64_t lost           = 0;
  uint64_t overwritten    = 0;
  uint64_t discarded      = 0;
  uint64_t pauses_sent    = 0;
  uint64_t resumes_sent   = 0;
  uint64_t sync_faults    = 0;
};

/*
  One subscribed stream.

  The connector's delivery thread calls Deliver; consumers call Next or
  Drain. Ordering is enforced on the sequence number, never on arrival:
  a packet older than the next expected sequence is dropped, a forward
  gap beyond the tolerance puts the session into ERROR. So does a packet
  whose sync confidence or clock drift falls outside the negotiated
  bounds. Entering ERROR from Deliver reports the session to the fault
  handler.
*/
class StreamSession {
 public:
  using FaultHandler = std::function<void(const std::string& session_id)>;

  StreamSession(std::string id, BridgeUri uri, OpenRequest request, SessionOptions options, std::shared_ptr<BridgeConnector> connector,
                bool realtime);

  const std::string& id() const {
    return id_;
  }
  const BridgeUri& uri() const {
    return uri_;
  }
  const OpenRequest& request() const {
    return request_;
  }
  bool realtime() const {
    return realtime_;
  }

  SessionState    state() const;
  SessionStats    stats() const;
  util::TimePoint last_activity() const;
  std::size_t     queued() const;

  // throws util::InvalidState on an illegal edge
  void Transition(SessionState to);

  // forgets the expected sequence and clock, used after a reconnect
  void ResetSequence();

  // must be set before packets flow
  void SetFaultHandler(FaultHandler handler);

  // Closes the session for good. Buffered packets stay readable; once
  // they are consumed Next and Drain throw `error`.
  void Fail(util::StreamError error);

  // producer side; throws util::StreamError(kOverrun) when the channel stays full
  void Deliver(SensorPacketPtr packet);

  // consumer side; both throw the failure recorded by Fail once the buffer is empty
  std::optional<SensorPacketPtr> Next(std::chrono::milliseconds timeout);
  std::vector<SensorPacketPtr>   Drain(std::size_t max_packets);

  // closes the channel and wakes blocked producers and consumers
  void Shutdown();

 private:
  void TransitionLocked(SessionState to);
  void AfterPop();
  void ThrowIfFailed() const;
  // returns the fault to report, empty when the packet is in bounds
  std::string CheckSyncLocked(const SensorPacket& packet);

  const std::string                id_;
  const BridgeUri                  uri_;
  const OpenRequest                request_;
  const SessionOptions             options_;
  std::shared_ptr<BridgeConnector> connector_;
  const bool                       realtime_;

  BoundedChannel<SensorPacketPtr> channel_;
  const std::size_t               high_mark_;
  const std::size_t               low_mark_;

  mutable std::mutex mutex_;
  SessionState       state_ = SessionState::kClosed;
  SessionStats       stats_;
  bool               have_expected_ = false;
  uint64_t           next_expected_ = 0;
  util::TimePoint    last_activity_;
  FaultHandler       fault_handler_;

  // clock of the last accepted packet
  bool     have_clock_     = false;
  uint64_t last_sequence_  = 0;
  uint64_t last_timestamp_ = 0;
  double   last_span_ns_   = 0.0;

  std::optional<util::StreamError> failure_;
};

} // namespace sensorweave::stream
