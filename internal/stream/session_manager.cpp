#include "session_manager.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/registry/capability_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace sensorweave::stream {

using namespace sensorweave::v1;
using observability::IntField;
using observability::StringField;

namespace {

util::StreamError Rejected(const std::string& reason, const std::string& bridge_id) {
  return util::StreamError(util::StreamErrorCode::kRejectedParams, "subscribe rejected: " + reason, {.bridge_id = bridge_id});
}

uint32_t ParseUint(const std::map<std::string, std::string>& params, const std::string& key, const std::string& bridge_id) {
  auto it = params.find(key);
  if (it == params.end()) return 0;

  uint32_t value = 0;
  const auto* begin = it->second.data();
  const auto* end   = begin + it->second.size();
  auto [ptr, ec]    = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end) throw Rejected("parameter " + key + " is not an unsigned integer", bridge_id);
  return value;
}

std::optional<Transport> ParseTransport(std::string name) {
  std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  Transport transport;
  if (Transport_Parse("TRANSPORT_" + name, &transport) && transport != TRANSPORT_UNSPECIFIED) return transport;
  return std::nullopt;
}

bool Offers(const BridgeCapability& capability, Transport transport) {
  return std::find(capability.transports().begin(), capability.transports().end(), transport) != capability.transports().end();
}

} // namespace

SessionManager::SessionManager(std::shared_ptr<registry::CapabilityRegistry> registry, std::shared_ptr<BridgeConnector> connector, SessionOptions options,
                               Sleeper sleeper)
    : registry_(std::move(registry)), connector_(std::move(connector)), options_(options), sleeper_(std::move(sleeper)) {
  if (!registry_ || !connector_) throw std::invalid_argument("session manager requires a registry and a connector");
  if (!sleeper_) {
    // backoff waits end early on shutdown
    sleeper_ = [queue = recovery_](std::chrono::milliseconds d) {
      std::unique_lock lock(queue->mutex);
      queue->cv.wait_for(lock, d, [&] { return queue->stopping; });
    };
  }
  if (options_.auto_recover) recovery_thread_ = std::thread(&SessionManager::RecoveryLoop, this);
}

SessionManager::~SessionManager() {
  {
    std::lock_guard lock(recovery_->mutex);
    recovery_->stopping = true;
  }
  recovery_->cv.notify_all();
  if (recovery_thread_.joinable()) recovery_thread_.join();
}

uint64_t SessionManager::recoveries() const {
  std::lock_guard lock(recovery_->mutex);
  return recovery_->finished;
}

void SessionManager::RecoveryLoop() {
  std::unique_lock lock(recovery_->mutex);
  while (true) {
    recovery_->cv.wait(lock, [this] { return recovery_->stopping || !recovery_->pending.empty(); });
    if (recovery_->stopping) break;

    const auto session_id = recovery_->pending.front();
    recovery_->pending.pop_front();
    lock.unlock();

    try {
      Recover(session_id);
    } catch (const util::StreamError& e) {
      SENSORWEAVE_LOG_ERROR("stream recovery gave up", {StringField("session_id", session_id), StringField("error", e.what())});
    } catch (const util::NotFound&) {
      // unsubscribed while queued
    } catch (const util::InvalidState& e) {
      SENSORWEAVE_LOG_DEBUG("stream recovery skipped", {StringField("session_id", session_id), StringField("error", e.what())});
    }

    lock.lock();
    ++recovery_->finished;
    recovery_->cv.notify_all();
  }
}

OpenRequest SessionManager::Negotiate(const BridgeUri& uri, const SubscribeParams& params, const std::string& session_id) const {
  const auto& bridge_id = uri.bridge_id;
  if (uri.resource != ResourceType::kStream) {
    throw Rejected(std::string("resource type '") + ToString(uri.resource) + "' is not subscribable", bridge_id);
  }

  const auto capability = registry_->Get(bridge_id);

  OpenRequest request;
  request.session_id  = session_id;
  request.capability  = capability;
  request.stream_spec = uri.spec;

  // rate
  uint32_t rate = params.sample_rate ? params.sample_rate : ParseUint(uri.params, "rate", bridge_id);
  if (rate == 0) rate = capability.max_sample_rate();
  if (rate == 0 || rate > capability.max_sample_rate()) throw Rejected("sample rate outside 1.." + std::to_string(capability.max_sample_rate()), bridge_id);
  request.sample_rate = rate;

  // channels
  const uint32_t advertised = std::max<uint32_t>(1, capability.channels());
  uint32_t       channels   = params.channels ? params.channels : ParseUint(uri.params, "channels", bridge_id);
  if (channels == 0) channels = advertised;
  if (channels > advertised || channels > 255) throw Rejected("requested channels exceed advertised " + std::to_string(advertised), bridge_id);
  request.channels = channels;

  // format
  std::string format_name = params.format;
  if (format_name.empty()) {
    if (auto it = uri.params.find("format"); it != uri.params.end()) format_name = it->second;
  }
  if (format_name.empty()) {
    request.format = FormatForBitDepth(capability.bit_depth());
  } else {
    auto format = ParseSampleFormat(format_name);
    if (!format) throw Rejected("unknown sample format '" + format_name + "'", bridge_id);
    if (BitWidth(*format) < capability.bit_depth()) throw Rejected("format " + format_name + " cannot carry the bridge bit depth", bridge_id);
    request.format = *format;
  }

  // sync
  uint32_t min_sync = params.min_sync_confidence ? params.min_sync_confidence : ParseUint(uri.params, "min_sync", bridge_id);
  if (min_sync > 100) throw Rejected("min_sync must be a confidence in 0..100", bridge_id);
  request.sync                = SelectSync(capability);
  request.min_sync_confidence = static_cast<uint8_t>(min_sync);
  if (!request.sync.IsAcceptable(request.min_sync_confidence)) {
    throw Rejected("sync confidence " + std::to_string(request.sync.confidence) + " below required " + std::to_string(min_sync), bridge_id);
  }

  auto max_drift = params.max_drift;
  if (max_drift.count() == 0) max_drift = std::chrono::microseconds(ParseUint(uri.params, "max_drift_us", bridge_id));
  if (max_drift.count() == 0) max_drift = options_.max_sync_drift;
  request.max_drift_ns = max_drift.count();

  // transport
  std::vector<Transport> preferred = params.preferred_transports;
  if (preferred.empty()) {
    if (auto it = uri.params.find("transport"); it != uri.params.end()) {
      auto transport = ParseTransport(it->second);
      if (!transport) throw Rejected("unknown transport '" + it->second + "'", bridge_id);
      preferred.push_back(*transport);
    }
  }
  request.transport = TRANSPORT_UNSPECIFIED;
  for (auto transport : preferred) {
    if (Offers(capability, transport)) {
      request.transport = transport;
      break;
    }
  }
  if (request.transport == TRANSPORT_UNSPECIFIED && capability.transports_size() > 0) {
    request.transport = static_cast<Transport>(capability.transports(0));
  }

  return request;
}

std::shared_ptr<StreamSession> SessionManager::Subscribe(const std::string& uri_text, const SubscribeParams& params) {
  auto uri = ParseBridgeUri(uri_text);

  bool realtime = params.realtime;
  if (auto it = uri.params.find("mode"); it != uri.params.end()) realtime = realtime || it->second == "realtime";

  const auto session_id = util::NewId();
  auto       request    = Negotiate(uri, params, session_id);
  auto       session    = std::make_shared<StreamSession>(session_id, uri, request, options_, connector_, realtime);

  session->Transition(SessionState::kNegotiating);
  if (options_.auto_recover) {
    session->SetFaultHandler([queue = std::weak_ptr<RecoveryQueue>(recovery_)](const std::string& id) {
      auto q = queue.lock();
      if (!q) return;
      {
        std::lock_guard lock(q->mutex);
        q->pending.push_back(id);
      }
      q->cv.notify_all();
    });
  }

  std::weak_ptr<StreamSession> weak = session;
  try {
    connector_->Open(session->request(), [weak](SensorPacketPtr packet) {
      if (auto s = weak.lock()) s->Deliver(std::move(packet));
    });
  } catch (const std::exception& e) {
    session->Transition(SessionState::kClosed);
    SENSORWEAVE_LOG_WARN("stream open failed", {StringField("bridge_id", uri.bridge_id), StringField("error", e.what())});
    throw;
  }

  session->Transition(SessionState::kOpen);
  {
    std::lock_guard lock(mutex_);
    sessions_[session_id] = session;
  }

  SENSORWEAVE_LOG_INFO("stream subscribed", {StringField("session_id", session_id), StringField("bridge_id", uri.bridge_id),
                                             IntField("sample_rate", request.sample_rate), IntField("sync_confidence", request.sync.confidence),
                                             StringField("format", ToString(request.format))});
  return session;
}

std::shared_ptr<StreamSession> SessionManager::Get(const std::string& session_id) const {
  std::lock_guard lock(mutex_);
  auto            it = sessions_.find(session_id);
  if (it == sessions_.end()) throw util::NotFound("stream session " + session_id + " not found");
  return it->second;
}

std::size_t SessionManager::Size() const {
  std::lock_guard lock(mutex_);
  return sessions_.size();
}

void SessionManager::CloseSession(const std::shared_ptr<StreamSession>& session) {
  session->Transition(SessionState::kClosed);
  session->Shutdown();
  connector_->Close(session->id());
}

void SessionManager::Unsubscribe(const std::string& session_id) {
  std::shared_ptr<StreamSession> session;
  {
    std::lock_guard lock(mutex_);
    auto            it = sessions_.find(session_id);
    if (it == sessions_.end()) throw util::NotFound("stream session " + session_id + " not found");
    session = it->second;
    sessions_.erase(it);
  }

  CloseSession(session);
  SENSORWEAVE_LOG_INFO("stream unsubscribed", {StringField("session_id", session_id)});
}

void SessionManager::Recover(const std::string& session_id) {
  auto session = Get(session_id);
  if (session->state() != SessionState::kError) {
    throw util::InvalidState("recover: session " + session_id + " is " + ToString(session->state()) + ", not ERROR");
  }

  session->Transition(SessionState::kNegotiating);

  for (uint32_t attempt = 0; attempt < options_.max_reconnect_attempts; ++attempt) {
    const auto scaled  = options_.reconnect_base_backoff * (int64_t{1} << std::min<uint32_t>(attempt, 30));
    const auto backoff = std::min<std::chrono::milliseconds>(scaled, options_.reconnect_max_backoff);
    sleeper_(backoff);

    try {
      if (connector_->Reconnect(session->request())) {
        session->ResetSequence();
        session->Transition(SessionState::kOpen);
        observability::Metrics::Instance().RecordSessionEvent("recovered");
        SENSORWEAVE_LOG_INFO("stream recovered", {StringField("session_id", session_id), IntField("attempt", attempt + 1)});
        return;
      }
    } catch (const util::StreamError& e) {
      SENSORWEAVE_LOG_WARN("stream reconnect attempt failed",
                           {StringField("session_id", session_id), IntField("attempt", attempt + 1), StringField("error", e.what())});
    }
  }

  {
    std::lock_guard lock(mutex_);
    sessions_.erase(session_id);
  }
  util::StreamError lost(util::StreamErrorCode::kSyncLost,
                         "reconnect attempts exhausted after " + std::to_string(options_.max_reconnect_attempts) + " tries",
                         {.bridge_id = session->request().capability.bridge_id(), .stream_id = session_id});
  session->Fail(lost);
  connector_->Close(session_id);
  observability::Metrics::Instance().RecordSessionEvent("sync_lost");
  throw lost;
}

std::size_t SessionManager::Sweep(util::TimePoint now) {
  std::vector<std::shared_ptr<StreamSession>> idle;
  {
    std::lock_guard lock(mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      if (now - it->second->last_activity() > options_.idle_timeout) {
        idle.push_back(it->second);
        it = sessions_.erase(it);
      } else {
        ++it;
      }
    }
  }

  for (const auto& session : idle) {
    CloseSession(session);
    SENSORWEAVE_LOG_INFO("stream closed after idle timeout", {StringField("session_id", session->id())});
  }
  return idle.size();
}

} // namespace sensorweave::stream
