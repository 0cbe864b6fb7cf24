#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "checkpoint/manager/v1_types.hpp"
#include "internal/db/api/manifest_repository.hpp"

namespace checkpoint::manifest {

/*
  SnapshotManifest

  The coordinator's only durable mutable structure:
    epoch → ManifestEntry               (coordinated)
    worker → [SnapshotRecord] by seq    (uncoordinated)

  Every mutation is committed to the repository before the in-memory view
  changes, so the cache never runs ahead of what a restart would load.

  Writers: the coordinator loop (epochs, local records) and the compactor
  (range deletes). Readers get copies; CompletedEpochs() never exposes an
  in-flight entry.
*/
class SnapshotManifest {
 public:
  explicit SnapshotManifest(std::shared_ptr<db::ManifestRepository> repository);

  // Reload the view from the repository. Called once at startup.
  void Load();

  bool Empty() const;

  // Highest epoch present in any state; 0 when none.
  uint64_t MaxEpoch() const;

  // ------------------------------------------------------------------
  // Coordinated
  // ------------------------------------------------------------------

  void PutEpoch(const manager::v1::ManifestEntry& entry);

  std::optional<manager::v1::ManifestEntry> Epoch(uint64_t epoch) const;

  // COMPLETE entries, ascending.
  std::vector<manager::v1::ManifestEntry> CompletedEpochs() const;

  // Entries left in a non-terminal state (crash during an epoch).
  std::vector<manager::v1::ManifestEntry> PendingEpochs() const;

  std::vector<uint64_t> EpochNumbers() const;

  void DropEpochsBelow(uint64_t epoch);

  // ------------------------------------------------------------------
  // Uncoordinated
  // ------------------------------------------------------------------

  /*
    Append a worker's local record.

    A record whose sequence is not above the worker's latest is rejected
    with InvalidState, except an exact duplicate which is accepted as a
    retried report.
  */
  void AppendLocal(const manager::v1::SnapshotRecord& record);

  std::vector<std::string> LocalWorkers() const;

  // ascending by sequence
  std::vector<manager::v1::SnapshotRecord> LocalRecords(const std::string& worker_id) const;

  std::optional<uint64_t> LatestLocalSequence(const std::string& worker_id) const;

  void DropLocalBelow(const std::string& worker_id, uint64_t generation);

 private:
  std::shared_ptr<db::ManifestRepository> repository_;

  mutable std::shared_mutex                                              mutex_;
  std::map<uint64_t, manager::v1::ManifestEntry>                         epochs_;
  std::map<std::string, std::map<uint64_t, manager::v1::SnapshotRecord>> local_;
};

using SnapshotManifestPtr = std::shared_ptr<SnapshotManifest>;

bool IsTerminal(manager::v1::EpochState state);

} // namespace checkpoint::manifest
