#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace checkpoint::runtime {

/*
  Runs a callback on a fixed interval from its own thread.

  Used for every timer-driven activity: heartbeat scan, epoch trigger,
  compaction, local snapshot timer, heartbeat sender. Callbacks should only
  enqueue work or touch state they own.

  Exceptions thrown by the callback are logged and the schedule continues.
*/
class PeriodicTask {
 public:
  PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> tick);
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask&)            = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;

  void Start();
  void Stop();

  // Run the next tick now instead of at the end of the interval.
  void Wake();

  const std::string& Name() const {
    return name_;
  }

 private:
  void Loop();

  std::string               name_;
  std::chrono::milliseconds interval_;
  std::function<void()>     tick_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    wake_ = false;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace checkpoint::runtime
