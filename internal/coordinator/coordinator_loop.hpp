#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "checkpoint/manager/v1_types.hpp"
#include "internal/coordinator/barrier_broadcaster.hpp"
#include "internal/coordinator/coordinator_mailbox.hpp"
#include "internal/coordinator/epoch_manager.hpp"
#include "internal/coordinator/heartbeat_monitor.hpp"
#include "internal/manifest/snapshot_manifest.hpp"

namespace checkpoint::coordinator {

/*
  CoordinatorLoop

  Single owner of the epoch state machine. Everything that mutates epoch
  state arrives as a CoordinatorEvent:

      heartbeat scan  ─ WorkerDead / WorkerRejoined ─┐
      epoch timer     ─ EpochTick ───────────────────┤
      AckSnapshot RPC ─ SnapshotAcked ───────────────┼─► mailbox ─► loop thread
      Report RPC      ─ LocalSnapshotReported ───────┘

  Readers (GetEpochStatus) see the view published after the last event.
  A DEAD worker shrinks the in-flight epoch first, then is handed to the
  recovery side through OnWorkerDead.
*/
class CoordinatorLoop {
 public:
  using EpochCompleteHook = std::function<void(uint64_t epoch)>;
  using WorkerDeadHook    = std::function<void(const std::string& worker_id)>;

  CoordinatorLoop(manager::v1::Strategy strategy, manifest::SnapshotManifestPtr manifest, std::shared_ptr<HeartbeatMonitor> monitor,
                  std::shared_ptr<BarrierBroadcaster> broadcaster, std::shared_ptr<CoordinatorMailbox> mailbox);
  ~CoordinatorLoop();

  CoordinatorLoop(const CoordinatorLoop&)            = delete;
  CoordinatorLoop& operator=(const CoordinatorLoop&) = delete;

  // Resumes epoch numbering after the manifest and the highest epoch already
  // stored. Call before Start().
  void Recover(uint64_t highest_stored_epoch = 0);

  void Start();
  void Stop();

  // Handles at most one event. Returns false when none arrived within `wait`.
  bool RunOnce(std::chrono::milliseconds wait);

  void OnEpochComplete(EpochCompleteHook hook);

  // Called on the loop thread for every worker declared DEAD.
  void OnWorkerDead(WorkerDeadHook hook);

  EpochView Status() const;

  manager::v1::Strategy ConfiguredStrategy() const {
    return strategy_;
  }

 private:
  void Run();
  void Handle(const CoordinatorEvent& event);
  void HandleTick();
  void HandleAck(const SnapshotAcked& ack);
  void HandleLocal(const LocalSnapshotReported& report);
  void HandleDead(const WorkerDead& dead);
  void Publish();
  void NotifyComplete();

  manager::v1::Strategy               strategy_;
  manifest::SnapshotManifestPtr       manifest_;
  std::shared_ptr<HeartbeatMonitor>   monitor_;
  std::shared_ptr<BarrierBroadcaster> broadcaster_;
  std::shared_ptr<CoordinatorMailbox> mailbox_;

  EpochManager      epochs_;
  EpochCompleteHook on_complete_;
  WorkerDeadHook    on_dead_;

  mutable std::mutex    view_mutex_;
  EpochView             view_;
  util::SteadyTimePoint view_at_{};

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace checkpoint::coordinator
