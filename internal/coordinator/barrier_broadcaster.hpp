#pragma once

#include <grpcpp/channel.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "checkpoint/manager/v1.hpp"
#include "internal/coordinator/heartbeat_monitor.hpp"

namespace checkpoint::coordinator {

/*
  Delivers snapshot barriers to workers.

  Delivery is fire-and-forget from the epoch's point of view: a worker that
  misses its barrier either acks later or is declared DEAD by the monitor.
*/
class BarrierBroadcaster {
 public:
  virtual ~BarrierBroadcaster() = default;

  // Returns the number of workers that accepted the barrier.
  virtual size_t Broadcast(uint64_t epoch, const std::vector<std::string>& workers) = 0;
};

class GrpcBarrierBroadcaster final : public BarrierBroadcaster {
 public:
  GrpcBarrierBroadcaster(std::shared_ptr<HeartbeatMonitor> monitor, std::chrono::milliseconds deadline = std::chrono::milliseconds(2000));

  size_t Broadcast(uint64_t epoch, const std::vector<std::string>& workers) override;

 private:
  manager::v1::CheckpointWorkerService::Stub* StubFor(const std::string& address);

  std::shared_ptr<HeartbeatMonitor> monitor_;
  std::chrono::milliseconds         deadline_;

  std::mutex                                                                         mutex_;
  std::map<std::string, std::unique_ptr<manager::v1::CheckpointWorkerService::Stub>> stubs_;
};

} // namespace checkpoint::coordinator
