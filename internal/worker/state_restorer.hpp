#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "checkpoint/manager/v1_types.hpp"
#include "internal/storage/snapshot_store.hpp"
#include "internal/worker/event_log.hpp"
#include "internal/worker/partition_state_store.hpp"

namespace checkpoint::worker {

struct RestoreResult {
  bool     from_snapshot = false;
  uint64_t generation    = 0;
  uint64_t replayed      = 0;
};

// Applies one log event to the state; stale offsets are skipped.
bool ApplyEvent(PartitionStateStore& state, const LogEvent& event);

/*
  Rebuilds a worker from its recovery plan:

      Get blob → verify CRC32C → decode → Restore → replay log from offsets

  Partitions the worker owns but the snapshot does not mention replay from 0.
  Throws util::RecoveryInconsistency when the blob does not match its record.
*/
class StateRestorer {
 public:
  StateRestorer(storage::SnapshotStorePtr store, std::shared_ptr<EventLog> event_log);

  RestoreResult Restore(const manager::v1::WorkerRecoveryPlan& plan, PartitionStateStore& state, const std::vector<std::string>& partitions);

  /*
    Plan built from the newest decodable uncoordinated snapshot in the store.
    Lets an uncoordinated worker recover while the coordinator is away.
  */
  std::optional<manager::v1::WorkerRecoveryPlan> LatestLocalPlan(const std::string& worker_id);

  // Replays every owned partition from the state's current offsets.
  uint64_t CatchUp(PartitionStateStore& state, const std::vector<std::string>& partitions);

 private:
  storage::SnapshotStorePtr store_;
  std::shared_ptr<EventLog> event_log_;
};

} // namespace checkpoint::worker
