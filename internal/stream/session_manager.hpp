#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "bridge_connector.hpp"
#include "stream_session.hpp"

namespace sensorweave::registry {
class CapabilityRegistry;
}

namespace sensorweave::stream {

struct SubscribeParams {
  // zero / empty fields fall back to the uri query, then to the bridge's capability
  uint32_t                                sample_rate = 0;
  uint32_t                                channels    = 0;
  std::string                             format;
  uint8_t                                 min_sync_confidence = 0;
  // zero falls back to the uri's max_drift_us, then to SessionOptions::max_sync_drift
  std::chrono::nanoseconds                max_drift{0};
  std::vector<sensorweave::v1::Transport> preferred_transports;
  bool                                    realtime = false;
};

/*
  Owns the subscribed sessions of one agent.

  With auto_recover set, a session that faults while delivering (a
  sequence gap or sync out of bounds) is queued for a recovery thread
  that runs Recover. When the attempts run out the session is failed
  with kSyncLost, which its consumer sees after draining the buffer.
*/
class SessionManager {
 public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  SessionManager(std::shared_ptr<registry::CapabilityRegistry> registry, std::shared_ptr<BridgeConnector> connector, SessionOptions options = {},
                 Sleeper sleeper = {});
  ~SessionManager();

  SessionManager(const SessionManager&)            = delete;
  SessionManager& operator=(const SessionManager&) = delete;

  // throws util::StreamError(kRejectedParams), util::DiscoveryError(kNotFound), util::InvalidArgument
  std::shared_ptr<StreamSession> Subscribe(const std::string& uri, const SubscribeParams& params = {});

  void                           Unsubscribe(const std::string& session_id);
  std::shared_ptr<StreamSession> Get(const std::string& session_id) const;
  std::size_t                    Size() const;

  // ERROR -> NEGOTIATING -> OPEN with exponential backoff; throws util::StreamError(kSyncLost) when exhausted
  void Recover(const std::string& session_id);

  // closes sessions idle for longer than idle_timeout; returns how many
  std::size_t Sweep(util::TimePoint now);

  // recovery runs finished by the background thread
  uint64_t recoveries() const;

 private:
  // faults are queued here; sessions hold it weakly so they may outlive the manager
  struct RecoveryQueue {
    std::mutex              mutex;
    std::condition_variable cv;
    std::deque<std::string> pending;
    bool                    stopping = false;
    uint64_t                finished = 0;
  };

  OpenRequest Negotiate(const BridgeUri& uri, const SubscribeParams& params, const std::string& session_id) const;
  void        CloseSession(const std::shared_ptr<StreamSession>& session);
  void        RecoveryLoop();

  std::shared_ptr<registry::CapabilityRegistry> registry_;
  std::shared_ptr<BridgeConnector>              connector_;
  SessionOptions                                options_;
  Sleeper                                       sleeper_;

  mutable std::mutex                                              mutex_;
  std::unordered_map<std::string, std::shared_ptr<StreamSession>> sessions_;

  std::shared_ptr<RecoveryQueue> recovery_ = std::make_shared<RecoveryQueue>();
  std::thread                    recovery_thread_;
};

} // namespace sensorweave::stream
