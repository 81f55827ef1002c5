#include "stream_session.hpp"

#include <algorithm>
#include <cmath>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace sensorweave::stream {

using observability::IntField;
using observability::StringField;

SessionOptions SessionOptions::FromConfig(const sensorweave::runtime::config::SessionConfig& config) {
  SessionOptions options;
  if (config.sequence_gap_tolerance() > 0) options.sequence_gap_tolerance = config.sequence_gap_tolerance();
  if (config.channel_capacity() > 0) options.channel_capacity = config.channel_capacity();
  if (config.high_watermark() > 0 && config.high_watermark() <= 1.0) options.high_watermark = config.high_watermark();
  if (config.low_watermark() > 0 && config.low_watermark() < options.high_watermark) options.low_watermark = config.low_watermark();
  options.overrun_timeout        = util::DurationOr(config.overrun_timeout(), options.overrun_timeout);
  options.idle_timeout           = util::DurationOr(config.idle_timeout(), options.idle_timeout);
  options.reconnect_base_backoff = util::DurationOr(config.reconnect_base_backoff(), options.reconnect_base_backoff);
  options.reconnect_max_backoff  = util::DurationOr(config.reconnect_max_backoff(), options.reconnect_max_backoff);
  if (config.max_reconnect_attempts() > 0) options.max_reconnect_attempts = config.max_reconnect_attempts();
  if (config.has_max_sync_drift()) {
    const auto& drift = config.max_sync_drift();
    const auto  ns    = std::chrono::seconds(drift.seconds()) + std::chrono::nanoseconds(drift.nanos());
    if (ns.count() > 0) options.max_sync_drift = ns;
  }
  if (config.has_auto_recover()) options.auto_recover = config.auto_recover();
  return options;
}

StreamSession::StreamSession(std::string id, BridgeUri uri, OpenRequest request, SessionOptions options, std::shared_ptr<BridgeConnector> connector,
                             bool realtime)
    : id_(std::move(id)),
      uri_(std::move(uri)),
      request_(std::move(request)),
      options_(options),
      connector_(std::move(connector)),
      realtime_(realtime),
      channel_(options.channel_capacity, realtime ? OverflowPolicy::kDropOldest : OverflowPolicy::kBlock),
      high_mark_(std::max<std::size_t>(1, static_cast<std::size_t>(std::ceil(options.high_watermark * channel_.Capacity())))),
      low_mark_(static_cast<std::size_t>(std::floor(options.low_watermark * channel_.Capacity()))),
      last_activity_(util::Now()) {
}

SessionState StreamSession::state() const {
  std::lock_guard lock(mutex_);
  return state_;
}

SessionStats StreamSession::stats() const {
  std::lock_guard lock(mutex_);
  auto            stats = stats_;
  stats.overwritten     = channel_.Overwritten();
  return stats;
}

util::TimePoint StreamSession::last_activity() const {
  std::lock_guard lock(mutex_);
  return last_activity_;
}

std::size_t StreamSession::queued() const {
  return channel_.Size();
}

void StreamSession::Transition(SessionState to) {
  std::lock_guard lock(mutex_);
  TransitionLocked(to);
}

void StreamSession::TransitionLocked(SessionState to) {
  if (!CanTransition(state_, to)) {
    throw util::InvalidState(std::string("stream session ") + id_ + ": illegal transition " + ToString(state_) + " -> " + ToString(to));
  }
  state_ = to;
}

void StreamSession::ResetSequence() {
  std::lock_guard lock(mutex_);
  have_expected_ = false;
  have_clock_    = false;
}

void StreamSession::SetFaultHandler(FaultHandler handler) {
  std::lock_guard lock(mutex_);
  fault_handler_ = std::move(handler);
}

void StreamSession::Fail(util::StreamError error) {
  {
    std::lock_guard lock(mutex_);
    failure_ = std::move(error);
    TransitionLocked(SessionState::kClosed);
  }
  channel_.Close();
}

void StreamSession::ThrowIfFailed() const {
  std::lock_guard lock(mutex_);
  if (failure_) throw *failure_;
}

std::string StreamSession::CheckSyncLocked(const SensorPacket& packet) {
  SyncQuality quality{packet.time_source, packet.sync_confidence, 0};

  // where the previous packet's clock says this one should start
  if (have_clock_ && packet.sequence > last_sequence_) {
    const double expected = static_cast<double>(last_timestamp_) + static_cast<double>(packet.sequence - last_sequence_) * last_span_ns_;
    quality.drift_ns      = std::llround(static_cast<double>(packet.timestamp_ns) - expected);
  }

  if (quality.IsAcceptable(request_.min_sync_confidence, request_.max_drift_ns)) {
    if (packet.sample_rate > 0 && packet.sample_count > 0) {
      have_clock_     = true;
      last_sequence_  = packet.sequence;
      last_timestamp_ = packet.timestamp_ns;
      last_span_ns_   = static_cast<double>(packet.sample_count) * 1e9 / packet.sample_rate;
    }
    return {};
  }

  if (quality.confidence < request_.min_sync_confidence) {
    return "sync confidence " + std::to_string(quality.confidence) + " below negotiated " + std::to_string(request_.min_sync_confidence);
  }
  return "clock drift " + std::to_string(quality.drift_ns) + "ns beyond negotiated " + std::to_string(request_.max_drift_ns) + "ns";
}

void StreamSession::Deliver(SensorPacketPtr packet) {
  if (!packet) return;

  FaultHandler on_fault;
  bool         faulted = false;
  {
    std::lock_guard lock(mutex_);
    if (!AcceptsPackets(state_)) {
      ++stats_.discarded;
      return;
    }
    last_activity_ = util::Now();

    if (have_expected_ && packet->sequence < next_expected_) {
      ++stats_.out_of_order;
      return;
    }

    const uint64_t gap = have_expected_ && packet->sequence > next_expected_ ? packet->sequence - next_expected_ : 0;
    if (gap > options_.sequence_gap_tolerance) {
      faulted = true;
      observability::Metrics::Instance().RecordSessionEvent("gap");
      SENSORWEAVE_LOG_WARN("stream sequence gap beyond tolerance",
                           {StringField("session_id", id_), IntField("expected", static_cast<int64_t>(next_expected_)),
                            IntField("received", static_cast<int64_t>(packet->sequence))});
    } else if (auto fault = CheckSyncLocked(*packet); !fault.empty()) {
      faulted = true;
      ++stats_.sync_faults;
      observability::Metrics::Instance().RecordSessionEvent("sync_fault");
      SENSORWEAVE_LOG_WARN("stream sync out of bounds", {StringField("session_id", id_), StringField("reason", fault),
                                                         IntField("sequence", static_cast<int64_t>(packet->sequence))});
    }

    if (faulted) {
      TransitionLocked(SessionState::kError);
      on_fault = fault_handler_;
    } else {
      stats_.lost += gap;
      have_expected_ = true;
      next_expected_ = packet->sequence + 1;
    }
  }

  if (faulted) {
    if (on_fault) on_fault(id_);
    return;
  }

  const auto result = channel_.Push(packet, options_.overrun_timeout);
  switch (result) {
    case PushResult::kOk:
      break;
    case PushResult::kOverwrote:
      observability::Metrics::Instance().RecordSessionEvent("overwrite");
      SENSORWEAVE_LOG_WARN("realtime channel overwrote oldest packet",
                           {StringField("session_id", id_), IntField("sequence", static_cast<int64_t>(packet->sequence))});
      break;
    case PushResult::kClosed: {
      std::lock_guard lock(mutex_);
      ++stats_.discarded;
      return;
    }
    case PushResult::kTimedOut:
      throw util::StreamError(util::StreamErrorCode::kOverrun, "consumer did not drain within overrun timeout",
                              {.bridge_id = request_.capability.bridge_id(), .stream_id = id_});
  }

  bool send_pause = false;
  {
    std::lock_guard lock(mutex_);
    ++stats_.delivered;
    if (!realtime_ && state_ == SessionState::kOpen && channel_.Size() >= high_mark_) {
      TransitionLocked(SessionState::kPaused);
      ++stats_.pauses_sent;
      send_pause = true;
    }
  }

  if (send_pause) {
    observability::Metrics::Instance().RecordSessionEvent("pause");
    connector_->SendFlowControl(id_, FlowControl::kPause);
  }
}

void StreamSession::AfterPop() {
  bool send_resume = false;
  {
    std::lock_guard lock(mutex_);
    last_activity_ = util::Now();
    if (state_ == SessionState::kPaused && channel_.Size() <= low_mark_) {
      TransitionLocked(SessionState::kOpen);
      ++stats_.resumes_sent;
      send_resume = true;
    }
  }

  if (send_resume) {
    observability::Metrics::Instance().RecordSessionEvent("resume");
    connector_->SendFlowControl(id_, FlowControl::kResume);
  }
}

std::optional<SensorPacketPtr> StreamSession::Next(std::chrono::milliseconds timeout) {
  auto packet = channel_.Pop(timeout);
  if (packet) {
    AfterPop();
    return packet;
  }
  ThrowIfFailed();
  return packet;
}

std::vector<SensorPacketPtr> StreamSession::Drain(std::size_t max_packets) {
  std::vector<SensorPacketPtr> out;
  while (out.size() < max_packets) {
    auto packet = channel_.TryPop();
    if (!packet) break;
    out.push_back(std::move(*packet));
    AfterPop();
  }
  if (out.empty() && max_packets > 0) ThrowIfFailed();
  return out;
}

void StreamSession::Shutdown() {
  channel_.Close();
}

} // namespace sensorweave::stream
