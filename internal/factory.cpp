#include "internal/factory.hpp"

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "client/cpp/coordinator_client.h"
#include "internal/coordinator/barrier_broadcaster.hpp"
#include "internal/coordinator/liveness_scan.hpp"
#include "internal/db/memory/memory_manifest_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_manifest_repository.hpp"
#include "internal/grpc/coordinator_server.hpp"
#include "internal/grpc/worker_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/coordinator_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/worker_service.hpp"
#include "internal/storage/snapshot_store_factory.hpp"
#include "internal/util/errors.hpp"
#include "internal/worker/memory_event_log.hpp"

namespace checkpoint::factory {

using namespace checkpoint::manager::v1;
using checkpoint::runtime::config::RuntimeConfig;

namespace {

std::chrono::milliseconds Seconds(uint32_t value) {
  return std::chrono::milliseconds(static_cast<int64_t>(value) * 1000);
}

std::chrono::milliseconds Millis(uint32_t value) {
  return std::chrono::milliseconds(value);
}

/*
  Startup recovery gate.

  Empty manifest      → fresh_start required
  Non-empty manifest  → a valid recovery point must exist; fresh_start
                        downgrades a failure to a warning
*/
void CheckRecoverable(const RuntimeConfig& config, const manifest::SnapshotManifest& manifest, const recovery::RecoveryManager& recovery) {
  const bool fresh_start = config.recovery().fresh_start();

  if (manifest.Empty()) {
    if (!fresh_start) {
      throw util::RecoveryInconsistency("snapshot manifest is empty; set recovery.fresh_start to initialize a new deployment");
    }
    CHECKPOINT_LOG_INFO("empty manifest, starting fresh");
    return;
  }

  try {
    auto point = recovery.SelectRecoveryPoint();
    CHECKPOINT_LOG_INFO("recovery point available at startup",
                        {observability::IntField("epoch", static_cast<int64_t>(point.epoch())),
                         observability::IntField("workers", point.workers_size())});
  } catch (const util::RecoveryInconsistency& e) {
    if (!fresh_start) throw;
    CHECKPOINT_LOG_WARN("no valid recovery point, continuing because fresh_start is set", {observability::StringField("error", e.what())});
  }
}

} // namespace

util::RetryPolicy RetryPolicyFrom(const RuntimeConfig& config) {
  util::RetryPolicy policy;
  policy.max_attempts    = config.write_retry().max_attempts();
  policy.initial_backoff = Millis(config.write_retry().initial_backoff_ms());
  policy.max_backoff     = Millis(config.write_retry().max_backoff_ms());
  return policy;
}

std::shared_ptr<db::ManifestRepository> BuildManifestRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::SqliteManifestRepository::BootstrapSchema(*sqlite_db);
    CHECKPOINT_LOG_INFO("Manifest repository ready", {observability::StringField("backend", "sqlite"), observability::StringField("path", sqlite_db->Path())});
    return std::make_shared<db::sqlite::SqliteManifestRepository>(std::move(sqlite_db));
  }

  CHECKPOINT_LOG_WARN("No manifest database configured; the manifest is lost on restart");
  return std::make_shared<db::memory::MemoryManifestRepository>();
}

CoordinatorApplication BuildCoordinator(const RuntimeConfig& config) {
  CoordinatorApplication app;
  const auto             strategy = config.checkpoint().strategy();

  // ------------------------------------------------------------------
  // Durable state
  // ------------------------------------------------------------------
  app.store = storage::StorageFactory::Build(config.storage());
  if (app.store->Kind() == storage::StoreKind::kRam) {
    CHECKPOINT_LOG_WARN("coordinator uses an in-process snapshot store; worker snapshots will not validate across processes");
  }

  app.manifest = std::make_shared<manifest::SnapshotManifest>(BuildManifestRepository(config));
  app.manifest->Load();

  app.recovery = std::make_shared<recovery::RecoveryManager>(strategy, app.manifest, app.store);
  CheckRecoverable(config, *app.manifest, *app.recovery);

  // ------------------------------------------------------------------
  // Liveness + epoch loop
  // ------------------------------------------------------------------
  app.monitor = std::make_shared<coordinator::HeartbeatMonitor>(Millis(config.heartbeat().limit_ms()));
  app.mailbox = std::make_shared<coordinator::CoordinatorMailbox>();

  std::shared_ptr<coordinator::BarrierBroadcaster> broadcaster;
  if (strategy == STRATEGY_COORDINATED) {
    broadcaster = std::make_shared<coordinator::GrpcBarrierBroadcaster>(app.monitor);
  }

  app.loop = std::make_shared<coordinator::CoordinatorLoop>(strategy, app.manifest, app.monitor, broadcaster, app.mailbox);
  app.loop->Recover(strategy == STRATEGY_COORDINATED
                        ? storage::HighestGeneration(*app.store, storage::common::StrategyPrefix(STRATEGY_COORDINATED))
                        : 0);

  app.compactor = std::make_shared<compaction::Compactor>(strategy, app.manifest, app.store);

  // ------------------------------------------------------------------
  // Timers
  // ------------------------------------------------------------------
  auto monitor = app.monitor;
  auto mailbox = app.mailbox;
  app.tasks.push_back(std::make_shared<runtime::PeriodicTask>("heartbeat-scan", Millis(config.heartbeat().check_interval_ms()),
                                                              [monitor, mailbox] { coordinator::ScanLiveness(*monitor, *mailbox, util::SteadyNow()); }));

  if (strategy == STRATEGY_COORDINATED) {
    app.tasks.push_back(std::make_shared<runtime::PeriodicTask>("epoch-trigger", Seconds(config.checkpoint().snapshot_frequency_sec()),
                                                                [mailbox] { mailbox->Post(coordinator::EpochTick{}); }));
  }

  auto compactor       = app.compactor;
  auto compaction_task = std::make_shared<runtime::PeriodicTask>("compaction", Seconds(config.checkpoint().compaction_interval_sec()),
                                                                 [compactor] { compactor->RunOnce(); });
  app.tasks.push_back(compaction_task);

  std::weak_ptr<runtime::PeriodicTask> weak_compaction = compaction_task;
  app.loop->OnEpochComplete([weak_compaction](uint64_t) {
    if (auto task = weak_compaction.lock()) task->Wake();
  });
  auto recovery = app.recovery;
  app.loop->OnWorkerDead([recovery](const std::string& worker_id) { recovery->MarkRecoveryPending(worker_id); });

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::CoordinatorContext ctx;
  ctx.strategy               = strategy;
  ctx.snapshot_frequency_sec = config.checkpoint().snapshot_frequency_sec();
  ctx.heartbeat_interval_ms  = config.heartbeat().check_interval_ms();
  ctx.monitor                = app.monitor;
  ctx.mailbox                = app.mailbox;
  ctx.loop                   = app.loop;
  ctx.recovery               = app.recovery;

  auto coordinator_service = std::make_shared<service::CoordinatorService>(ctx);
  app.grpc_services.push_back(std::make_unique<grpc::CoordinatorServer>(coordinator_service));

  return app;
}

void CoordinatorApplication::Start() {
  loop->Start();
  for (auto& task : tasks) {
    task->Start();
  }
}

void CoordinatorApplication::Stop() {
  for (auto& task : tasks) {
    task->Stop();
  }
  loop->Stop();
}

WorkerApplication BuildWorker(const RuntimeConfig& config, worker::SnapshotEngine::FatalHandler on_fatal) {
  WorkerApplication app;
  const auto&       worker_cfg = config.worker();
  const auto        strategy   = config.checkpoint().strategy();
  const auto        retry      = RetryPolicyFrom(config);
  const auto&       worker_id  = worker_cfg.worker_id();

  if (worker_id.empty()) {
    throw std::invalid_argument("worker.worker_id must be set");
  }
  if (worker_cfg.coordinator_address().empty()) {
    throw std::invalid_argument("worker.coordinator_address must be set");
  }

  app.partitions.assign(worker_cfg.partitions().begin(), worker_cfg.partitions().end());
  app.store     = storage::StorageFactory::Build(config.storage());
  app.event_log = std::make_shared<worker::MemoryEventLog>();
  app.state     = std::make_shared<worker::PartitionStateStore>();
  app.restorer  = std::make_shared<worker::StateRestorer>(app.store, app.event_log);

  if (!config.event_log().broker_address().empty()) {
    CHECKPOINT_LOG_INFO("event log broker configured, using in-process log",
                        {observability::StringField("broker_address", config.event_log().broker_address())});
  }

  // ------------------------------------------------------------------
  // Coordinator link + registration
  // ------------------------------------------------------------------
  auto channel = ::grpc::CreateChannel(worker_cfg.coordinator_address(), ::grpc::InsecureChannelCredentials());
  app.link     = std::make_shared<checkpoint::manager::client::CoordinatorClient>(channel);
  app.heartbeat =
      std::make_shared<worker::HeartbeatSender>(app.link, worker_id, worker_cfg.advertise_address(), Millis(config.heartbeat().check_interval_ms()));

  auto registered = app.heartbeat->Register();
  if (!registered.ok()) {
    if (strategy == STRATEGY_COORDINATED) {
      throw std::runtime_error("coordinator registration failed: " + registered.status().ToString());
    }
    CHECKPOINT_LOG_WARN("coordinator unreachable, continuing independently", {observability::StringField("error", registered.status().ToString())});
  } else if (registered->strategy() != strategy) {
    throw std::invalid_argument("worker strategy " + Strategy_Name(strategy) + " does not match coordinator strategy " +
                                Strategy_Name(registered->strategy()));
  }

  // ------------------------------------------------------------------
  // Restore
  // ------------------------------------------------------------------
  std::optional<WorkerRecoveryPlan> plan;
  auto                              point = app.link->GetRecoveryPoint(worker_id);
  if (point.ok()) {
    plan = recovery::RecoveryManager::PlanFor(*point, worker_id);
  } else if (strategy == STRATEGY_UNCOORDINATED) {
    CHECKPOINT_LOG_WARN("recovery point unavailable, restoring from the latest local snapshot",
                        {observability::StringField("error", point.status().ToString())});
    plan = app.restorer->LatestLocalPlan(worker_id);
  } else {
    throw util::RecoveryInconsistency("recovery point unavailable: " + point.status().ToString());
  }
  app.restorer->Restore(plan ? *plan : recovery::EmptyPlan(worker_id), *app.state, app.partitions);

  // ------------------------------------------------------------------
  // Snapshot path
  // ------------------------------------------------------------------
  app.engine = std::make_shared<worker::SnapshotEngine>(worker_id, app.state, app.store, retry);
  app.engine->ResumeSequence();
  app.engine->SetFatalHandler(std::move(on_fatal));

  app.reporter  = std::make_shared<worker::SnapshotReporter>(app.link, retry);
  auto reporter = app.reporter;
  app.engine->SetCompletionSink([reporter](const SnapshotRecord& record) { reporter->Enqueue(record); });

  if (strategy == STRATEGY_UNCOORDINATED) {
    app.local_timer = std::make_shared<worker::LocalSnapshotTimer>(app.engine, Seconds(config.checkpoint().snapshot_frequency_sec()));
  }

  auto state      = app.state;
  auto restorer   = app.restorer;
  auto partitions = app.partitions;
  app.tasks.push_back(std::make_shared<runtime::PeriodicTask>("event-processing", std::chrono::milliseconds(100),
                                                              [state, restorer, partitions] { restorer->CatchUp(*state, partitions); }));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::WorkerContext ctx;
  ctx.strategy = strategy;
  ctx.engine   = app.engine;

  auto worker_service = std::make_shared<service::WorkerService>(ctx);
  app.grpc_services.push_back(std::make_unique<grpc::WorkerServer>(worker_service));

  return app;
}

void WorkerApplication::Start() {
  engine->Start();
  reporter->Start();
  heartbeat->Start();
  if (local_timer) local_timer->Start();
  for (auto& task : tasks) {
    task->Start();
  }
}

void WorkerApplication::Stop() {
  for (auto& task : tasks) {
    task->Stop();
  }
  if (local_timer) local_timer->Stop();
  heartbeat->Stop();
  engine->Stop();
  reporter->Stop();
}

} // namespace checkpoint::factory
