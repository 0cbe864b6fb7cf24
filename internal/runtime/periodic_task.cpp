#include "internal/runtime/periodic_task.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace checkpoint::runtime {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> tick)
    : name_(std::move(name)), interval_(interval), tick_(std::move(tick)) {
  if (interval_.count() <= 0) {
    throw std::invalid_argument("periodic task '" + name_ + "' requires a positive interval");
  }
  if (!tick_) {
    throw std::invalid_argument("periodic task '" + name_ + "' requires a callback");
  }
}

PeriodicTask::~PeriodicTask() {
  Stop();
}

void PeriodicTask::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&PeriodicTask::Loop, this);
}

void PeriodicTask::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void PeriodicTask::Wake() {
  {
    std::lock_guard lock(mutex_);
    wake_ = true;
  }
  cv_.notify_all();
}

void PeriodicTask::Loop() {
  while (running_) {
    {
      std::unique_lock lock(mutex_);
      cv_.wait_for(lock, interval_, [&] { return !running_ || wake_; });
      if (!running_) break;
      wake_ = false;
    }

    try {
      tick_();
    } catch (const std::exception& e) {
      CHECKPOINT_LOG_ERROR("Periodic task failed", {observability::StringField("task", name_), observability::StringField("error", e.what())});
    }
  }
}

} // namespace checkpoint::runtime
