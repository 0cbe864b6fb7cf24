#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "checkpoint/manager/v1_types.hpp"
#include "internal/manifest/snapshot_manifest.hpp"
#include "internal/storage/snapshot_store.hpp"

namespace checkpoint::compaction {

struct CompactionReport {
  size_t deleted_objects = 0;
  size_t dropped_entries = 0;
  size_t failures        = 0;
};

/*
  Compactor

  Coordinated:
    per worker, horizon = second most recent COMPLETE epoch holding a
    record for that worker (latest when only one)
    coordinated/<w>/<g> with g < horizon(w) is deleted, referenced or not,
    then manifest entries below the smallest horizon are dropped.
    A worker left out of newer epochs keeps its last complete record.

  Uncoordinated:
    per worker, horizon = latest recorded sequence
    uncoordinated/<w>/<s> with s < horizon is deleted.

  Nothing at or above a horizon is touched. Failed deletions are counted and
  picked up again on the next run; manifest entries are only dropped after
  every object below the horizon is gone.
*/
class Compactor {
 public:
  Compactor(manager::v1::Strategy strategy, manifest::SnapshotManifestPtr manifest, storage::SnapshotStorePtr store);

  CompactionReport RunOnce();

  // Oldest retained epoch per worker that appears in a COMPLETE epoch.
  static std::map<std::string, uint64_t> WorkerHorizons(const std::vector<manager::v1::ManifestEntry>& complete);

 private:
  CompactionReport CompactCoordinated();
  CompactionReport CompactUncoordinated();

  manager::v1::Strategy         strategy_;
  manifest::SnapshotManifestPtr manifest_;
  storage::SnapshotStorePtr     store_;
};

} // namespace checkpoint::compaction
