#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace sensorweave::stream {

enum class OverflowPolicy {
  kBlock,      // producer waits for space, up to a timeout
  kDropOldest, // producer overwrites the oldest queued element
};

enum class PushResult {
  kOk,
  kOverwrote,
  kTimedOut,
  kClosed,
};

/*
  Thread-safe bounded FIFO between one producer and its consumers.

  Nothing is ever dropped without the producer being told: kBlock returns
  kTimedOut, kDropOldest returns kOverwrote.
*/
template <typename T>
class BoundedChannel {
 public:
  BoundedChannel(std::size_t capacity, OverflowPolicy policy) : capacity_(capacity == 0 ? 1 : capacity), policy_(policy) {
  }

  PushResult Push(T value, std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    if (closed_) return PushResult::kClosed;

    PushResult result = PushResult::kOk;
    if (queue_.size() >= capacity_) {
      if (policy_ == OverflowPolicy::kDropOldest) {
        queue_.pop_front();
        ++overwritten_;
        result = PushResult::kOverwrote;
      } else if (!not_full_.wait_for(lock, timeout, [&] { return closed_ || queue_.size() < capacity_; })) {
        return PushResult::kTimedOut;
      } else if (closed_) {
        return PushResult::kClosed;
      }
    }

    queue_.push_back(std::move(value));
    lock.unlock();
    not_empty_.notify_one();
    return result;
  }

  std::optional<T> Pop(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    if (!not_empty_.wait_for(lock, timeout, [&] { return closed_ || !queue_.empty(); })) return std::nullopt;
    return PopLocked(lock);
  }

  std::optional<T> TryPop() {
    std::unique_lock lock(mutex_);
    return PopLocked(lock);
  }

  void Close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  std::size_t Size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

  std::size_t Capacity() const {
    return capacity_;
  }

  OverflowPolicy Policy() const {
    return policy_;
  }

  std::size_t Overwritten() const {
    std::lock_guard lock(mutex_);
    return overwritten_;
  }

 private:
  std::optional<T> PopLocked(std::unique_lock<std::mutex>& lock) {
    if (queue_.empty()) return std::nullopt;
    T value = std::move(queue_.front());
    queue_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return value;
  }

  const std::size_t    capacity_;
  const OverflowPolicy policy_;

  mutable std::mutex      mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T>           queue_;
  std::size_t             overwritten_ = 0;
  bool                    closed_      = false;
};

} // namespace sensorweave::stream
