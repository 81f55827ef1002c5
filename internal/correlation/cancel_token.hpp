#pragma once

#include <atomic>
#include <memory>

namespace sensorweave::correlation {

// Shared between a requester and an in-flight computation.
class CancelToken {
 public:
  static std::shared_ptr<CancelToken> Create() {
    return std::make_shared<CancelToken>();
  }

  void Cancel() {
    cancelled_.store(true, std::memory_order_release);
  }

  bool IsCancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

 private:
  std::atomic<bool> cancelled_{false};
};

using CancelTokenPtr = std::shared_ptr<CancelToken>;

} // namespace sensorweave::correlation
