#pragma once

#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "checkpoint/manager/v1_types.hpp"
#include "internal/manifest/snapshot_manifest.hpp"
#include "internal/storage/snapshot_store.hpp"

namespace checkpoint::recovery {

/*
  RecoveryManager

  Chooses where workers resume after a failure.

    COORDINATED    highest COMPLETE epoch whose every record validates;
                   all workers replay from that epoch's offsets. A worker
                   absent from that epoch (shrunk out while DEAD) gets its
                   record from the newest older COMPLETE epoch holding a
                   valid one.
    UNCOORDINATED  per worker, latest record that validates; workers
                   replay independently from their own offsets.

  A record validates when its blob exists and both size and CRC32C match.
  Workers without a valid record restore empty state and replay from
  offset 0.
*/
class RecoveryManager {
 public:
  RecoveryManager(manager::v1::Strategy strategy, manifest::SnapshotManifestPtr manifest, storage::SnapshotStorePtr store);

  // Throws util::RecoveryInconsistency when the manifest holds no valid point.
  manager::v1::RecoveryPoint SelectRecoveryPoint() const;

  /*
    Point served to workers while running. Before the first snapshot of the
    configured strategy is recorded this is an empty point (every worker
    starts from scratch) instead of an error.
  */
  manager::v1::RecoveryPoint Current() const;

  static manager::v1::WorkerRecoveryPlan PlanFor(const manager::v1::RecoveryPoint& point, const std::string& worker_id);

  bool Validate(const manager::v1::SnapshotRecord& record) const;

  /*
    Recovery bookkeeping for workers the heartbeat monitor declared DEAD.
    A worker stays pending until it asks for its recovery point again.
  */
  void                     MarkRecoveryPending(const std::string& worker_id);
  void                     MarkRecovered(const std::string& worker_id);
  std::vector<std::string> PendingRecovery() const;

 private:
  manager::v1::RecoveryPoint SelectCoordinated() const;
  manager::v1::RecoveryPoint SelectUncoordinated() const;

  manager::v1::Strategy         strategy_;
  manifest::SnapshotManifestPtr manifest_;
  storage::SnapshotStorePtr     store_;

  mutable std::mutex    pending_mutex_;
  std::set<std::string> pending_;
};

// Plan that replays every partition from the start.
manager::v1::WorkerRecoveryPlan EmptyPlan(const std::string& worker_id);

} // namespace checkpoint::recovery
