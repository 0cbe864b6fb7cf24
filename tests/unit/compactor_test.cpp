#include "internal/compaction/compactor.hpp"

#include <arrow/buffer.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_manifest_repository.hpp"
#include "internal/storage/common/key_layout.hpp"
#include "internal/storage/ram/ram_snapshot_store.hpp"

namespace {

using checkpoint::compaction::Compactor;
using checkpoint::manifest::SnapshotManifest;
using checkpoint::storage::common::SnapshotKey;
using checkpoint::storage::common::WorkerPrefix;
using namespace checkpoint::manager::v1;

std::shared_ptr<SnapshotManifest> NewManifest() {
  auto manifest = std::make_shared<SnapshotManifest>(std::make_shared<checkpoint::db::memory::MemoryManifestRepository>());
  manifest->Load();
  return manifest;
}

SnapshotRecord StoreSnapshot(checkpoint::storage::SnapshotStore& store, Strategy strategy, const std::string& worker_id, uint64_t generation) {
  SnapshotRecord record;
  record.set_worker_id(worker_id);
  record.set_strategy(strategy);
  record.set_generation(generation);
  record.set_storage_key(SnapshotKey(strategy, worker_id, generation));
  record.set_size_bytes(4);
  store.Put(record.storage_key(), arrow::Buffer::FromString("blob"));
  return record;
}

void PutEpoch(SnapshotManifest& manifest, checkpoint::storage::SnapshotStore& store, uint64_t epoch, EpochState state,
              const std::vector<std::string>& workers) {
  ManifestEntry entry;
  entry.set_epoch(epoch);
  entry.set_state(state);
  for (const auto& worker_id : workers) {
    entry.add_required_workers(worker_id);
    *entry.add_records() = StoreSnapshot(store, STRATEGY_COORDINATED, worker_id, epoch);
  }
  manifest.PutEpoch(entry);
}

bool Stored(checkpoint::storage::SnapshotStore& store, const std::string& key) {
  for (const auto& listed : store.List(key)) {
    if (listed == key) return true;
  }
  return false;
}

ManifestEntry CompleteEntry(uint64_t epoch, const std::vector<std::string>& workers) {
  ManifestEntry entry;
  entry.set_epoch(epoch);
  entry.set_state(EPOCH_STATE_COMPLETE);
  for (const auto& worker_id : workers) {
    auto* record = entry.add_records();
    record->set_worker_id(worker_id);
    record->set_generation(epoch);
  }
  return entry;
}

void TestHorizonIsSecondLatestCompletePerWorker() {
  assert(Compactor::WorkerHorizons({}).empty());

  auto single = Compactor::WorkerHorizons({CompleteEntry(4, {"w-1"})});
  assert(single.size() == 1);
  assert(single.at("w-1") == 4u);

  auto horizons = Compactor::WorkerHorizons(
      {CompleteEntry(5, {"w-1", "w-2"}), CompleteEntry(7, {"w-1", "w-2"}), CompleteEntry(9, {"w-1"})});
  assert(horizons.at("w-1") == 7u);
  assert(horizons.at("w-2") == 5u);
}

void TestCoordinatedKeepsLatestTwoCompleteEpochs() {
  auto manifest = NewManifest();
  auto store    = std::make_shared<checkpoint::storage::RamSnapshotStore>();

  for (uint64_t epoch : {8, 9, 10}) {
    PutEpoch(*manifest, *store, epoch, EPOCH_STATE_COMPLETE, {"w-1", "w-2"});
  }
  // Unreferenced leftover of an abandoned epoch.
  PutEpoch(*manifest, *store, 7, EPOCH_STATE_INCOMPLETE, {"w-1"});

  Compactor compactor(STRATEGY_COORDINATED, manifest, store);
  auto      report = compactor.RunOnce();

  assert(report.failures == 0);
  assert(report.deleted_objects == 3);
  assert(report.dropped_entries == 2);

  for (const auto& worker_id : {"w-1", "w-2"}) {
    auto keys = store->List(WorkerPrefix(STRATEGY_COORDINATED, worker_id));
    assert(keys.size() == 2);
    assert(keys[0] == SnapshotKey(STRATEGY_COORDINATED, worker_id, 9));
    assert(keys[1] == SnapshotKey(STRATEGY_COORDINATED, worker_id, 10));
  }
  assert(!manifest->Epoch(8).has_value());
  assert(manifest->Epoch(9).has_value());
  assert(manifest->CompletedEpochs().back().epoch() == 10);
}

void TestCompactionIsIdempotent() {
  auto manifest = NewManifest();
  auto store    = std::make_shared<checkpoint::storage::RamSnapshotStore>();
  for (uint64_t epoch : {1, 2, 3}) {
    PutEpoch(*manifest, *store, epoch, EPOCH_STATE_COMPLETE, {"w-1"});
  }

  Compactor compactor(STRATEGY_COORDINATED, manifest, store);
  assert(compactor.RunOnce().deleted_objects == 1);

  auto again = compactor.RunOnce();
  assert(again.deleted_objects == 0);
  assert(again.dropped_entries == 0);
  assert(again.failures == 0);
  assert(store->List("coordinated/").size() == 2);
}

void TestCoordinatedNeverTouchesInFlightEpoch() {
  auto manifest = NewManifest();
  auto store    = std::make_shared<checkpoint::storage::RamSnapshotStore>();
  PutEpoch(*manifest, *store, 1, EPOCH_STATE_COMPLETE, {"w-1"});
  PutEpoch(*manifest, *store, 2, EPOCH_STATE_COMPLETE, {"w-1"});
  PutEpoch(*manifest, *store, 3, EPOCH_STATE_COMPLETE, {"w-1"});
  PutEpoch(*manifest, *store, 4, EPOCH_STATE_COLLECTING_ACKS, {"w-1"});

  Compactor compactor(STRATEGY_COORDINATED, manifest, store);
  assert(compactor.RunOnce().deleted_objects == 1);

  auto keys = store->List(WorkerPrefix(STRATEGY_COORDINATED, "w-1"));
  assert(keys.size() == 3);
  assert(keys[2] == SnapshotKey(STRATEGY_COORDINATED, "w-1", 4));
  assert(manifest->Epoch(4)->state() == EPOCH_STATE_COLLECTING_ACKS);
}

void TestNothingCompleteMeansNothingDeleted() {
  auto manifest = NewManifest();
  auto store    = std::make_shared<checkpoint::storage::RamSnapshotStore>();
  PutEpoch(*manifest, *store, 1, EPOCH_STATE_INCOMPLETE, {"w-1"});

  Compactor compactor(STRATEGY_COORDINATED, manifest, store);
  auto      report = compactor.RunOnce();
  assert(report.deleted_objects == 0);
  assert(store->List("coordinated/").size() == 1);
}

void TestWorkerMissingFromNewerEpochsKeepsItsSnapshot() {
  auto manifest = NewManifest();
  auto store    = std::make_shared<checkpoint::storage::RamSnapshotStore>();

  PutEpoch(*manifest, *store, 8, EPOCH_STATE_COMPLETE, {"w-a", "w-b"});
  // w-b went DEAD and was shrunk out of the next two epochs.
  PutEpoch(*manifest, *store, 9, EPOCH_STATE_COMPLETE, {"w-a"});
  PutEpoch(*manifest, *store, 10, EPOCH_STATE_COMPLETE, {"w-a"});

  Compactor compactor(STRATEGY_COORDINATED, manifest, store);
  auto      report = compactor.RunOnce();

  assert(report.failures == 0);
  assert(report.deleted_objects == 1);
  assert(report.dropped_entries == 0);

  auto b = store->List(WorkerPrefix(STRATEGY_COORDINATED, "w-b"));
  assert(b.size() == 1);
  assert(b[0] == SnapshotKey(STRATEGY_COORDINATED, "w-b", 8));
  assert(!Stored(*store, SnapshotKey(STRATEGY_COORDINATED, "w-a", 8)));
  assert(manifest->Epoch(8).has_value());

  // Once w-b is back in two newer epochs its old snapshot is superseded.
  PutEpoch(*manifest, *store, 11, EPOCH_STATE_COMPLETE, {"w-a", "w-b"});
  PutEpoch(*manifest, *store, 12, EPOCH_STATE_COMPLETE, {"w-a", "w-b"});
  report = compactor.RunOnce();
  assert(report.failures == 0);
  assert(!Stored(*store, SnapshotKey(STRATEGY_COORDINATED, "w-b", 8)));
  assert(!manifest->Epoch(8).has_value());
  assert(store->List(WorkerPrefix(STRATEGY_COORDINATED, "w-b")).size() == 2);
}

void TestUncoordinatedKeepsLatestPerWorker() {
  auto manifest = NewManifest();
  auto store    = std::make_shared<checkpoint::storage::RamSnapshotStore>();

  for (uint64_t seq : {1, 2, 3}) {
    manifest->AppendLocal(StoreSnapshot(*store, STRATEGY_UNCOORDINATED, "w-1", seq));
  }
  manifest->AppendLocal(StoreSnapshot(*store, STRATEGY_UNCOORDINATED, "w-2", 1));
  // Written but never reported; newer than the manifest knows, so it stays.
  StoreSnapshot(*store, STRATEGY_UNCOORDINATED, "w-2", 2);

  Compactor compactor(STRATEGY_UNCOORDINATED, manifest, store);
  auto      report = compactor.RunOnce();

  assert(report.deleted_objects == 2);
  assert(report.dropped_entries == 2);

  auto w1 = store->List(WorkerPrefix(STRATEGY_UNCOORDINATED, "w-1"));
  assert(w1.size() == 1);
  assert(w1[0] == SnapshotKey(STRATEGY_UNCOORDINATED, "w-1", 3));
  assert(store->List(WorkerPrefix(STRATEGY_UNCOORDINATED, "w-2")).size() == 2);

  auto records = manifest->LocalRecords("w-1");
  assert(records.size() == 1);
  assert(records[0].generation() == 3);
}

void TestUncoordinatedCompactionIsIdempotent() {
  auto manifest = NewManifest();
  auto store    = std::make_shared<checkpoint::storage::RamSnapshotStore>();
  for (uint64_t seq : {1, 2, 3}) {
    manifest->AppendLocal(StoreSnapshot(*store, STRATEGY_UNCOORDINATED, "w-1", seq));
    manifest->AppendLocal(StoreSnapshot(*store, STRATEGY_UNCOORDINATED, "w-2", seq));
  }

  Compactor compactor(STRATEGY_UNCOORDINATED, manifest, store);
  auto      first = compactor.RunOnce();
  assert(first.deleted_objects == 4);
  assert(first.dropped_entries == 4);

  auto again = compactor.RunOnce();
  assert(again.deleted_objects == 0);
  assert(again.dropped_entries == 0);
  assert(again.failures == 0);
  assert(store->List("uncoordinated/").size() == 2);
}

} // namespace

int main() {
  TestHorizonIsSecondLatestCompletePerWorker();
  TestCoordinatedKeepsLatestTwoCompleteEpochs();
  TestCompactionIsIdempotent();
  TestCoordinatedNeverTouchesInFlightEpoch();
  TestNothingCompleteMeansNothingDeleted();
  TestWorkerMissingFromNewerEpochsKeepsItsSnapshot();
  TestUncoordinatedKeepsLatestPerWorker();
  TestUncoordinatedCompactionIsIdempotent();

  std::cout << "checkpoint_unit_compactor: pass\n";
  return 0;
}
