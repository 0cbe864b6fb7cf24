#pragma once

#include <grpcpp/grpcpp.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/compaction/compactor.hpp"
#include "internal/coordinator/coordinator_loop.hpp"
#include "internal/coordinator/coordinator_mailbox.hpp"
#include "internal/coordinator/heartbeat_monitor.hpp"
#include "internal/manifest/snapshot_manifest.hpp"
#include "internal/recovery/recovery_manager.hpp"
#include "internal/runtime/periodic_task.hpp"
#include "internal/storage/snapshot_store.hpp"
#include "internal/worker/coordinator_link.hpp"
#include "internal/worker/event_log.hpp"
#include "internal/worker/heartbeat_sender.hpp"
#include "internal/worker/local_snapshot_timer.hpp"
#include "internal/worker/partition_state_store.hpp"
#include "internal/worker/snapshot_engine.hpp"
#include "internal/worker/snapshot_reporter.hpp"
#include "internal/worker/state_restorer.hpp"

namespace checkpoint::factory {

/*
  CoordinatorApplication

  Owns every long-lived coordinator component. Periodic tasks only post to
  the mailbox or run the compactor; the loop owns epoch state.
*/
struct CoordinatorApplication {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  storage::SnapshotStorePtr                        store;
  manifest::SnapshotManifestPtr                    manifest;
  std::shared_ptr<coordinator::HeartbeatMonitor>   monitor;
  std::shared_ptr<coordinator::CoordinatorMailbox> mailbox;
  std::shared_ptr<coordinator::CoordinatorLoop>    loop;
  std::shared_ptr<compaction::Compactor>           compactor;
  std::shared_ptr<recovery::RecoveryManager>       recovery;

  std::vector<std::shared_ptr<runtime::PeriodicTask>> tasks;

  void Start();
  void Stop();
};

/*
  WorkerApplication

  Worker state, snapshot engine and everything that talks to the
  coordinator. Event processing runs as a periodic catch-up against the
  event log.
*/
struct WorkerApplication {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  std::vector<std::string>                     partitions;
  storage::SnapshotStorePtr                    store;
  std::shared_ptr<worker::EventLog>            event_log;
  std::shared_ptr<worker::PartitionStateStore> state;
  std::shared_ptr<worker::CoordinatorLink>     link;
  std::shared_ptr<worker::SnapshotEngine>      engine;
  std::shared_ptr<worker::SnapshotReporter>    reporter;
  std::shared_ptr<worker::StateRestorer>       restorer;
  std::shared_ptr<worker::HeartbeatSender>     heartbeat;
  std::shared_ptr<worker::LocalSnapshotTimer>  local_timer;

  std::vector<std::shared_ptr<runtime::PeriodicTask>> tasks;

  void Start();
  void Stop();
};

/*
  BuildCoordinator

  Composition root of the coordinator. Loads the manifest and refuses to
  start without a usable recovery point unless recovery.fresh_start is set.
  Throws util::RecoveryInconsistency in that case.
*/
CoordinatorApplication BuildCoordinator(const checkpoint::runtime::config::RuntimeConfig& config);

/*
  BuildWorker

  Registers with the coordinator, restores state from the recovery plan and
  wires the snapshot path. `on_fatal` is called from the snapshot writer
  when the worker can no longer serialize its state.
*/
WorkerApplication BuildWorker(const checkpoint::runtime::config::RuntimeConfig& config, worker::SnapshotEngine::FatalHandler on_fatal);

// Builds the manifest repository selected by configuration (memory when none).
std::shared_ptr<db::ManifestRepository> BuildManifestRepository(const checkpoint::runtime::config::RuntimeConfig& config);

util::RetryPolicy RetryPolicyFrom(const checkpoint::runtime::config::RuntimeConfig& config);

} // namespace checkpoint::factory
