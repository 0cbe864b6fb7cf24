#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "internal/runtime/periodic_task.hpp"
#include "internal/worker/coordinator_link.hpp"

namespace checkpoint::worker {

/*
  Registers the worker and keeps it alive on the coordinator.

  A heartbeat answered with KeyError means the coordinator lost the worker
  (restart); the next tick registers again.
*/
class HeartbeatSender {
 public:
  HeartbeatSender(std::shared_ptr<CoordinatorLink> link, std::string worker_id, std::string advertise_address, std::chrono::milliseconds interval);

  // Registration attempt without waiting for the first tick.
  arrow::Result<manager::v1::RegisterWorkerResponse> Register();

  void Start();
  void Stop();

  // One heartbeat, registering first when needed.
  arrow::Status Tick();

  bool Registered() const {
    return registered_.load();
  }

 private:
  std::shared_ptr<CoordinatorLink> link_;
  std::string                      worker_id_;
  std::string                      advertise_address_;
  std::atomic<bool>                registered_{false};
  runtime::PeriodicTask            task_;
};

} // namespace checkpoint::worker
