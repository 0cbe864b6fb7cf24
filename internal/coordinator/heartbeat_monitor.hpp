#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "checkpoint/manager/v1_types.hpp"
#include "internal/util/time.hpp"

namespace checkpoint::coordinator {

struct WorkerLiveness {
  std::string               worker_id;
  std::string               address;
  util::SteadyTimePoint     last_heartbeat;
  manager::v1::WorkerStatus status{manager::v1::WORKER_STATUS_ALIVE};
};

struct LivenessTransition {
  std::string               worker_id;
  manager::v1::WorkerStatus from;
  manager::v1::WorkerStatus to;
};

/*
  HeartbeatMonitor

  Liveness table: worker → last heartbeat (monotonic clock) + status.

    silent >  limit / 2   → SUSPECT
    silent >  limit       → DEAD
    any heartbeat         → ALIVE

  Guarded by one mutex. Heartbeat RPCs write it directly; the periodic scan
  reports transitions which the caller forwards to the coordinator loop.
*/
class HeartbeatMonitor {
 public:
  explicit HeartbeatMonitor(std::chrono::milliseconds limit);

  // Returns the previous status, UNSPECIFIED for a first registration.
  manager::v1::WorkerStatus Register(const std::string& worker_id, const std::string& address, util::SteadyTimePoint now);

  // Returns the previous status. Throws NotFound for unregistered workers.
  manager::v1::WorkerStatus Heartbeat(const std::string& worker_id, util::SteadyTimePoint now);

  std::vector<LivenessTransition> Scan(util::SteadyTimePoint now);

  // Workers not DEAD; suspects still owe acks for the current epoch.
  std::vector<std::string> AliveWorkers() const;

  std::optional<manager::v1::WorkerStatus> Status(const std::string& worker_id) const;
  std::optional<std::string>               Address(const std::string& worker_id) const;

  std::vector<WorkerLiveness> Snapshot() const;

  std::chrono::milliseconds Limit() const {
    return limit_;
  }

 private:
  manager::v1::WorkerStatus Classify(util::SteadyTimePoint last, util::SteadyTimePoint now) const;

  std::chrono::milliseconds limit_;

  mutable std::mutex                    mutex_;
  std::map<std::string, WorkerLiveness> workers_;
};

} // namespace checkpoint::coordinator
