#include "internal/coordinator/coordinator_loop.hpp"

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/memory/memory_manifest_repository.hpp"
#include "internal/storage/common/key_layout.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace std::chrono_literals;
using checkpoint::coordinator::CoordinatorLoop;
using checkpoint::coordinator::CoordinatorMailbox;
using checkpoint::coordinator::EpochTick;
using checkpoint::coordinator::HeartbeatMonitor;
using checkpoint::coordinator::LocalSnapshotReported;
using checkpoint::coordinator::SnapshotAcked;
using checkpoint::coordinator::WorkerDead;
using checkpoint::manifest::SnapshotManifest;
using namespace checkpoint::manager::v1;

class RecordingBroadcaster final : public checkpoint::coordinator::BarrierBroadcaster {
 public:
  size_t Broadcast(uint64_t epoch, const std::vector<std::string>& workers) override {
    std::lock_guard lock(mutex_);
    epochs.push_back(epoch);
    last_workers = workers;
    return workers.size();
  }

  std::vector<uint64_t>    epochs;
  std::vector<std::string> last_workers;

 private:
  std::mutex mutex_;
};

struct Harness {
  explicit Harness(Strategy strategy) {
    manifest = std::make_shared<SnapshotManifest>(std::make_shared<checkpoint::db::memory::MemoryManifestRepository>());
    manifest->Load();
    monitor     = std::make_shared<HeartbeatMonitor>(5000ms);
    mailbox     = std::make_shared<CoordinatorMailbox>();
    broadcaster = std::make_shared<RecordingBroadcaster>();
    loop        = std::make_shared<CoordinatorLoop>(strategy, manifest, monitor, broadcaster, mailbox);
    loop->Recover();
  }

  void Register(const std::string& worker_id) {
    monitor->Register(worker_id, worker_id + ":7201", checkpoint::util::SteadyNow());
  }

  void Drain() {
    while (loop->RunOnce(0ms)) {
    }
  }

  std::shared_ptr<SnapshotManifest>     manifest;
  std::shared_ptr<HeartbeatMonitor>     monitor;
  std::shared_ptr<CoordinatorMailbox>   mailbox;
  std::shared_ptr<RecordingBroadcaster> broadcaster;
  std::shared_ptr<CoordinatorLoop>      loop;
};

SnapshotRecord Record(const std::string& worker_id, Strategy strategy, uint64_t generation) {
  SnapshotRecord record;
  record.set_worker_id(worker_id);
  record.set_strategy(strategy);
  record.set_generation(generation);
  record.set_storage_key(checkpoint::storage::common::SnapshotKey(strategy, worker_id, generation));
  return record;
}

void TestCoordinatedRoundThroughMailbox() {
  Harness h(STRATEGY_COORDINATED);
  h.Register("w-1");
  h.Register("w-2");

  std::vector<uint64_t> completed;
  h.loop->OnEpochComplete([&](uint64_t epoch) { completed.push_back(epoch); });

  assert(h.mailbox->Post(EpochTick{}));
  h.Drain();

  assert(h.broadcaster->epochs.size() == 1);
  assert(h.broadcaster->epochs[0] == 1);
  assert(h.broadcaster->last_workers.size() == 2);

  auto pending = h.loop->Status();
  assert(pending.current_epoch == 1);
  assert(pending.state == EPOCH_STATE_COLLECTING_ACKS);
  assert(pending.missing_acks.size() == 2);

  // A tick while collecting does not start another epoch.
  assert(h.mailbox->Post(EpochTick{}));
  h.Drain();
  assert(h.broadcaster->epochs.size() == 1);

  assert(h.mailbox->Post(SnapshotAcked{1, Record("w-1", STRATEGY_COORDINATED, 1)}));
  assert(h.mailbox->Post(SnapshotAcked{1, Record("w-2", STRATEGY_COORDINATED, 1)}));
  h.Drain();

  assert(completed.size() == 1);
  assert(completed[0] == 1);

  auto done = h.loop->Status();
  assert(done.latest_complete == 1);
  assert(done.missing_acks.empty());
  assert(h.manifest->CompletedEpochs().size() == 1);

  assert(h.mailbox->Post(EpochTick{}));
  h.Drain();
  assert(h.broadcaster->epochs.size() == 2);
  assert(h.broadcaster->epochs[1] == 2);
}

void TestDeadWorkerShrinksEpoch() {
  Harness h(STRATEGY_COORDINATED);
  h.Register("w-1");
  h.Register("w-2");
  h.Register("w-3");

  std::vector<uint64_t> completed;
  h.loop->OnEpochComplete([&](uint64_t epoch) { completed.push_back(epoch); });

  h.mailbox->Post(EpochTick{});
  h.mailbox->Post(SnapshotAcked{1, Record("w-1", STRATEGY_COORDINATED, 1)});
  h.mailbox->Post(SnapshotAcked{1, Record("w-2", STRATEGY_COORDINATED, 1)});
  h.Drain();
  assert(completed.empty());
  assert(h.loop->Status().missing_acks == std::vector<std::string>{"w-3"});

  h.mailbox->Post(WorkerDead{"w-3"});
  h.Drain();

  assert(completed.size() == 1);
  auto entry = h.manifest->Epoch(1);
  assert(entry->state() == EPOCH_STATE_COMPLETE);
  assert(entry->records_size() == 2);
}

void TestStartStopRunsOnOwnThread() {
  Harness h(STRATEGY_COORDINATED);
  h.Register("w-1");

  std::mutex              mutex;
  std::condition_variable cv;
  bool                    done = false;
  h.loop->OnEpochComplete([&](uint64_t) {
    std::lock_guard lock(mutex);
    done = true;
    cv.notify_all();
  });

  h.loop->Start();
  h.mailbox->Post(EpochTick{});
  h.mailbox->Post(SnapshotAcked{1, Record("w-1", STRATEGY_COORDINATED, 1)});
  {
    std::unique_lock lock(mutex);
    const bool       completed = cv.wait_for(lock, 5s, [&] { return done; });
    assert(completed);
  }
  h.loop->Stop();

  // Events posted after Stop are refused.
  assert(!h.mailbox->Post(EpochTick{}));
}

void TestDeadWorkerIsHandedToRecovery() {
  Harness h(STRATEGY_COORDINATED);
  h.Register("w-1");
  h.Register("w-2");

  std::vector<std::string> dead;
  h.loop->OnWorkerDead([&](const std::string& worker_id) { dead.push_back(worker_id); });

  // Outside any epoch the death still reaches recovery.
  h.mailbox->Post(WorkerDead{"w-2"});
  h.Drain();
  assert(dead == std::vector<std::string>{"w-2"});

  h.mailbox->Post(EpochTick{});
  h.mailbox->Post(WorkerDead{"w-1"});
  h.Drain();
  assert(dead.size() == 2);
  assert(dead[1] == "w-1");
}

void TestUncoordinatedReportsGoToManifest() {
  Harness h(STRATEGY_UNCOORDINATED);
  h.Register("w-1");

  h.mailbox->Post(EpochTick{});
  h.mailbox->Post(LocalSnapshotReported{Record("w-1", STRATEGY_UNCOORDINATED, 1)});
  h.mailbox->Post(LocalSnapshotReported{Record("w-1", STRATEGY_UNCOORDINATED, 2)});
  // Stale report is logged and dropped, the loop keeps going.
  h.mailbox->Post(LocalSnapshotReported{Record("w-1", STRATEGY_UNCOORDINATED, 1)});
  h.mailbox->Post(LocalSnapshotReported{Record("w-2", STRATEGY_UNCOORDINATED, 1)});
  h.Drain();

  // No barriers in this mode.
  assert(h.broadcaster->epochs.empty());
  assert(h.loop->Status().state == EPOCH_STATE_IDLE);

  assert(h.manifest->LatestLocalSequence("w-1") == 2u);
  assert(h.manifest->LatestLocalSequence("w-2") == 1u);
}

} // namespace

int main() {
  TestCoordinatedRoundThroughMailbox();
  TestDeadWorkerShrinksEpoch();
  TestStartStopRunsOnOwnThread();
  TestDeadWorkerIsHandedToRecovery();
  TestUncoordinatedReportsGoToManifest();

  std::cout << "checkpoint_unit_coordinator_loop: pass\n";
  return 0;
}
