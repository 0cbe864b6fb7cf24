#include "internal/coordinator/heartbeat_monitor.hpp"

#include <stdexcept>

#include "internal/storage/common/key_layout.hpp"
#include "internal/util/errors.hpp"

namespace checkpoint::coordinator {

using namespace checkpoint::manager::v1;

HeartbeatMonitor::HeartbeatMonitor(std::chrono::milliseconds limit) : limit_(limit) {
  if (limit_.count() <= 0) {
    throw std::invalid_argument("heartbeat limit must be positive");
  }
}

WorkerStatus HeartbeatMonitor::Classify(util::SteadyTimePoint last, util::SteadyTimePoint now) const {
  // Full clock resolution: 5000.9ms of silence exceeds a 5000ms limit.
  const auto silent = now > last ? now - last : util::SteadyTimePoint::duration{0};
  if (silent > limit_) return WORKER_STATUS_DEAD;
  if (silent * 2 > limit_) return WORKER_STATUS_SUSPECT;
  return WORKER_STATUS_ALIVE;
}

WorkerStatus HeartbeatMonitor::Register(const std::string& worker_id, const std::string& address, util::SteadyTimePoint now) {
  storage::common::ValidateWorkerId(worker_id);

  std::lock_guard lock(mutex_);
  auto [it, inserted] = workers_.try_emplace(worker_id);
  auto previous       = inserted ? WORKER_STATUS_UNSPECIFIED : it->second.status;

  it->second.worker_id      = worker_id;
  it->second.address        = address;
  it->second.last_heartbeat = now;
  it->second.status         = WORKER_STATUS_ALIVE;
  return previous;
}

WorkerStatus HeartbeatMonitor::Heartbeat(const std::string& worker_id, util::SteadyTimePoint now) {
  std::lock_guard lock(mutex_);
  auto            it = workers_.find(worker_id);
  if (it == workers_.end()) {
    throw util::NotFound("worker not registered: " + worker_id);
  }

  auto previous = it->second.status;
  if (now > it->second.last_heartbeat) {
    it->second.last_heartbeat = now;
  }
  it->second.status = WORKER_STATUS_ALIVE;
  return previous;
}

std::vector<LivenessTransition> HeartbeatMonitor::Scan(util::SteadyTimePoint now) {
  std::vector<LivenessTransition> transitions;

  std::lock_guard lock(mutex_);
  for (auto& [worker_id, liveness] : workers_) {
    // DEAD is left only through a heartbeat or re-registration.
    if (liveness.status == WORKER_STATUS_DEAD) continue;

    auto next = Classify(liveness.last_heartbeat, now);
    if (next == liveness.status) continue;

    transitions.push_back({worker_id, liveness.status, next});
    liveness.status = next;
  }
  return transitions;
}

std::vector<std::string> HeartbeatMonitor::AliveWorkers() const {
  std::lock_guard          lock(mutex_);
  std::vector<std::string> out;
  for (const auto& [worker_id, liveness] : workers_) {
    if (liveness.status != WORKER_STATUS_DEAD) out.push_back(worker_id);
  }
  return out;
}

std::optional<WorkerStatus> HeartbeatMonitor::Status(const std::string& worker_id) const {
  std::lock_guard lock(mutex_);
  auto            it = workers_.find(worker_id);
  if (it == workers_.end()) return std::nullopt;
  return it->second.status;
}

std::optional<std::string> HeartbeatMonitor::Address(const std::string& worker_id) const {
  std::lock_guard lock(mutex_);
  auto            it = workers_.find(worker_id);
  if (it == workers_.end()) return std::nullopt;
  return it->second.address;
}

std::vector<WorkerLiveness> HeartbeatMonitor::Snapshot() const {
  std::lock_guard             lock(mutex_);
  std::vector<WorkerLiveness> out;
  out.reserve(workers_.size());
  for (const auto& [_, liveness] : workers_) {
    out.push_back(liveness);
  }
  return out;
}

} // namespace checkpoint::coordinator
