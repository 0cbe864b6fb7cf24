#include <arrow/result.h>
#include <arrow/status.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "internal/storage/common/key_layout.hpp"
#include "internal/storage/ram/ram_snapshot_store.hpp"
#include "internal/worker/coordinator_link.hpp"
#include "internal/worker/heartbeat_sender.hpp"
#include "internal/worker/local_snapshot_timer.hpp"
#include "internal/worker/partition_state_store.hpp"
#include "internal/worker/snapshot_engine.hpp"
#include "internal/worker/snapshot_reporter.hpp"

namespace {

using namespace checkpoint::manager::v1;
using namespace std::chrono_literals;

// Coordinator that never answers a report until released.
class StuckCoordinator final : public checkpoint::worker::CoordinatorLink {
 public:
  arrow::Result<RegisterWorkerResponse> RegisterWorker(const std::string&, const std::string&) override {
    return arrow::Status::IOError("coordinator unreachable");
  }

  arrow::Result<WorkerStatus> Heartbeat(const std::string&) override {
    return arrow::Status::IOError("coordinator unreachable");
  }

  arrow::Status AckSnapshot(uint64_t, const SnapshotRecord&) override {
    return arrow::Status::Invalid("no barriers in this mode");
  }

  arrow::Status ReportLocalSnapshot(const SnapshotRecord&) override {
    std::unique_lock lock(mutex_);
    ++calls_;
    cv_.notify_all();
    cv_.wait(lock, [&] { return released_; });
    return arrow::Status::OK();
  }

  arrow::Result<RecoveryPoint> GetRecoveryPoint(const std::string&) override {
    return arrow::Status::IOError("coordinator unreachable");
  }

  void WaitForCall() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] { return calls_ > 0; });
  }

  void Release() {
    std::lock_guard lock(mutex_);
    released_ = true;
    cv_.notify_all();
  }

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  int                     calls_    = 0;
  bool                    released_ = false;
};

// Heartbeats fail with KeyError until the worker registers again.
class ForgetfulCoordinator final : public checkpoint::worker::CoordinatorLink {
 public:
  arrow::Result<RegisterWorkerResponse> RegisterWorker(const std::string&, const std::string&) override {
    ++registrations;
    known = true;
    RegisterWorkerResponse resp;
    resp.set_strategy(STRATEGY_UNCOORDINATED);
    return resp;
  }

  arrow::Result<WorkerStatus> Heartbeat(const std::string&) override {
    ++heartbeats;
    if (!known) return arrow::Status::KeyError("unknown worker");
    return WORKER_STATUS_ALIVE;
  }

  arrow::Status AckSnapshot(uint64_t, const SnapshotRecord&) override {
    return arrow::Status::OK();
  }

  arrow::Status ReportLocalSnapshot(const SnapshotRecord&) override {
    return arrow::Status::OK();
  }

  arrow::Result<RecoveryPoint> GetRecoveryPoint(const std::string&) override {
    return RecoveryPoint{};
  }

  int  registrations = 0;
  int  heartbeats    = 0;
  bool known         = false;
};

template <typename Pred>
bool WaitUntil(Pred&& pred, std::chrono::milliseconds timeout = 5s) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred()) {
    if (std::chrono::steady_clock::now() > deadline) return false;
    std::this_thread::sleep_for(2ms);
  }
  return true;
}

void TestSnapshotsAndProcessingIgnoreStuckCoordinator() {
  auto coordinator = std::make_shared<StuckCoordinator>();
  auto store       = std::make_shared<checkpoint::storage::RamSnapshotStore>();
  auto state       = std::make_shared<checkpoint::worker::PartitionStateStore>();

  checkpoint::util::RetryPolicy retry;
  retry.max_attempts    = 2;
  retry.initial_backoff = 1ms;
  retry.max_backoff     = 2ms;

  auto engine   = std::make_shared<checkpoint::worker::SnapshotEngine>("w-1", state, store, retry);
  auto reporter = std::make_shared<checkpoint::worker::SnapshotReporter>(coordinator, retry);
  engine->SetCompletionSink([reporter](const SnapshotRecord& record) { reporter->Enqueue(record); });

  checkpoint::worker::LocalSnapshotTimer timer(engine, 1h);
  engine->Start();
  reporter->Start();

  uint64_t offset = 0;
  for (int round = 0; round < 3; ++round) {
    assert(state->Apply("p0", "k" + std::to_string(round), "v", offset++));
    assert(timer.Tick());
    const bool written = WaitUntil([&] { return !engine->InProgress(); });
    assert(written);
    if (round == 0) coordinator->WaitForCall();
  }

  // All three snapshots are durable although the first report never returned.
  assert(store->List(checkpoint::storage::common::WorkerPrefix(STRATEGY_UNCOORDINATED, "w-1")).size() == 3);
  assert(engine->NextSequence() == 4);
  const bool queued = WaitUntil([&] { return reporter->Backlog() == 2; });
  assert(queued);
  assert(reporter->Delivered() == 0);
  assert(state->NextOffset("p0") == 3);

  coordinator->Release();
  const bool delivered = WaitUntil([&] { return reporter->Delivered() == 3; });
  assert(delivered);

  reporter->Stop();
  engine->Stop();
}

void TestTimerSkipsWhileSnapshotInProgress() {
  auto state  = std::make_shared<checkpoint::worker::PartitionStateStore>();
  auto engine = std::make_shared<checkpoint::worker::SnapshotEngine>("w-1", state, std::make_shared<checkpoint::storage::RamSnapshotStore>(),
                                                                     checkpoint::util::RetryPolicy{});
  checkpoint::worker::LocalSnapshotTimer timer(engine, 1h);

  // Writer thread not started: the first capture stays queued.
  assert(timer.Tick());
  assert(engine->InProgress());
  assert(!timer.Tick());

  engine->Start();
  const bool drained = WaitUntil([&] { return !engine->InProgress(); });
  assert(drained);
  assert(timer.Tick());
  engine->Stop();
}

void TestHeartbeatRegistersAgainAfterCoordinatorRestart() {
  auto                                coordinator = std::make_shared<ForgetfulCoordinator>();
  checkpoint::worker::HeartbeatSender sender(coordinator, "w-1", "127.0.0.1:7201", 1h);

  assert(sender.Tick().ok());
  assert(sender.Registered());
  assert(coordinator->registrations == 1);

  // Coordinator restarted and lost its registry.
  coordinator->known = false;
  assert(sender.Tick().ok());
  assert(coordinator->registrations == 2);
  assert(sender.Registered());

  assert(sender.Tick().ok());
  assert(coordinator->registrations == 2);
  assert(coordinator->heartbeats == 3);
}

} // namespace

int main() {
  TestSnapshotsAndProcessingIgnoreStuckCoordinator();
  TestTimerSkipsWhileSnapshotInProgress();
  TestHeartbeatRegistersAgainAfterCoordinatorRestart();

  std::cout << "checkpoint_unit_uncoordinated_independence: pass\n";
  return 0;
}
