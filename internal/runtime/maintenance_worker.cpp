#include "maintenance_worker.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace sensorweave::runtime {

MaintenanceWorker::MaintenanceWorker(std::chrono::milliseconds interval) : interval_(interval) {
  if (interval_.count() <= 0) {
    interval_ = std::chrono::seconds(10);
  }
}

MaintenanceWorker::~MaintenanceWorker() {
  Stop();
}

void MaintenanceWorker::AddTask(std::string name, Task task) {
  tasks_.emplace_back(std::move(name), std::move(task));
}

void MaintenanceWorker::Start() {
  if (running_.exchange(true)) {
    return;
  }
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = false;
  }
  thread_ = std::thread(&MaintenanceWorker::Run, this);
}

void MaintenanceWorker::Stop() {
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable())
    thread_.join();
  running_ = false;
}

void MaintenanceWorker::RunOnce() {
  for (const auto& [name, task] : tasks_) {
    try {
      task();
    } catch (const std::exception& e) {
      SENSORWEAVE_LOG_ERROR("maintenance task failed", {sensorweave::observability::StringField("task", name),
                                                        sensorweave::observability::StringField("error", e.what())});
    }
  }
  ++ticks_;
}

void MaintenanceWorker::Run() {
  std::unique_lock lock(mutex_);
  while (!stop_requested_) {
    if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
      break;
    }
    lock.unlock();
    RunOnce();
    lock.lock();
  }
}

} // namespace sensorweave::runtime
