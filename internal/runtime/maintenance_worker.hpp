#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sensorweave::runtime {

/*
  Background worker that runs periodic housekeeping.

  Each tick runs every registered task in order; a task that throws is
  logged and does not stop the others. Stop wakes the worker immediately.
*/
class MaintenanceWorker {
 public:
  using Task = std::function<void()>;

  explicit MaintenanceWorker(std::chrono::milliseconds interval);
  ~MaintenanceWorker();

  MaintenanceWorker(const MaintenanceWorker&)            = delete;
  MaintenanceWorker& operator=(const MaintenanceWorker&) = delete;

  // must be called before Start
  void AddTask(std::string name, Task task);

  void Start();
  void Stop();

  // runs every task once on the calling thread
  void RunOnce();

  uint64_t ticks() const {
    return ticks_.load();
  }

 private:
  void Run();

  std::chrono::milliseconds                  interval_;
  std::vector<std::pair<std::string, Task>> tasks_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stop_requested_ = false;

  std::thread           thread_;
  std::atomic<bool>     running_{false};
  std::atomic<uint64_t> ticks_{0};
};

} // namespace sensorweave::runtime
