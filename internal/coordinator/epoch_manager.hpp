#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "checkpoint/manager/v1_types.hpp"
#include "internal/manifest/snapshot_manifest.hpp"
#include "internal/util/time.hpp"

namespace checkpoint::coordinator {

struct BarrierRequest {
  uint64_t                 epoch = 0;
  std::vector<std::string> workers;
};

struct EpochView {
  uint64_t                 current_epoch   = 0;
  manager::v1::EpochState  state           = manager::v1::EPOCH_STATE_IDLE;
  uint64_t                 latest_complete = 0;
  std::vector<std::string> missing_acks;
  uint64_t                 pending_ms = 0;
  util::TimePoint          requested_at{};
};

enum class AckOutcome {
  kIgnored,
  kRecorded,
  kCompleted,
};

enum class DeathOutcome {
  kIgnored,
  kShrunk,
  kCompleted,
  kAbandoned,
};

/*
  EpochManager

  Coordinated barrier state machine:

    IDLE ─Trigger→ SNAPSHOT_REQUESTED ─OnBarrierSent→ COLLECTING_ACKS
                                                        │
               acked ⊇ required ───────────────────────►COMPLETE
               required becomes empty (all DEAD) ──────►INCOMPLETE

  One epoch in flight at a time. Every transition is written to the
  manifest before the in-memory state moves, so a restart resumes numbering
  after the highest persisted epoch.

  Not thread safe: owned by the coordinator loop.
*/
class EpochManager {
 public:
  explicit EpochManager(manifest::SnapshotManifestPtr manifest);

  /*
    Rewrites epochs left pending by a crash as INCOMPLETE and resumes
    numbering after both the manifest and `highest_stored`, the highest
    coordinated generation already in the snapshot store. A manifest that
    lost history must not hand out an epoch whose keys are taken.
  */
  void Recover(uint64_t highest_stored = 0);

  std::optional<BarrierRequest> Trigger(const std::vector<std::string>& alive, util::SteadyTimePoint now);

  void OnBarrierSent(uint64_t epoch);

  AckOutcome OnAck(uint64_t epoch, const manager::v1::SnapshotRecord& record, util::SteadyTimePoint now);

  DeathOutcome OnWorkerDead(const std::string& worker_id, util::SteadyTimePoint now);

  bool InFlight() const {
    return in_flight_.has_value();
  }

  // Age of the in-flight epoch; 0 when idle.
  uint64_t StalledFor(util::SteadyTimePoint now) const;

  uint64_t LatestComplete() const {
    return latest_complete_;
  }

  uint64_t NextEpoch() const {
    return next_epoch_;
  }

  // Duration of the last finished epoch.
  uint64_t LastDurationMs() const {
    return last_duration_ms_;
  }

  EpochView View(util::SteadyTimePoint now) const;

 private:
  struct PendingEpoch {
    manager::v1::ManifestEntry                         entry;
    std::set<std::string>                              required;
    std::map<std::string, manager::v1::SnapshotRecord> acked;
    util::SteadyTimePoint                              started;
  };

  bool AllAcked() const;
  void Finish(manager::v1::EpochState state, util::SteadyTimePoint now);
  void Persist(manager::v1::EpochState state);

  manifest::SnapshotManifestPtr manifest_;

  uint64_t                next_epoch_       = 1;
  uint64_t                latest_complete_  = 0;
  uint64_t                last_duration_ms_ = 0;
  std::optional<PendingEpoch> in_flight_;
};

} // namespace checkpoint::coordinator
