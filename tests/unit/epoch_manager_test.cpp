#include "internal/coordinator/epoch_manager.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_manifest_repository.hpp"
#include "internal/storage/common/key_layout.hpp"

namespace {

using namespace std::chrono_literals;
using checkpoint::coordinator::AckOutcome;
using checkpoint::coordinator::DeathOutcome;
using checkpoint::coordinator::EpochManager;
using checkpoint::manifest::SnapshotManifest;
using namespace checkpoint::manager::v1;

const auto kStart = checkpoint::util::SteadyTimePoint{} + 1h;

std::shared_ptr<SnapshotManifest> NewManifest() {
  auto manifest = std::make_shared<SnapshotManifest>(std::make_shared<checkpoint::db::memory::MemoryManifestRepository>());
  manifest->Load();
  return manifest;
}

SnapshotRecord Record(const std::string& worker_id, uint64_t epoch) {
  SnapshotRecord record;
  record.set_worker_id(worker_id);
  record.set_strategy(STRATEGY_COORDINATED);
  record.set_generation(epoch);
  record.set_storage_key(checkpoint::storage::common::SnapshotKey(STRATEGY_COORDINATED, worker_id, epoch));
  record.set_size_bytes(16);
  return record;
}

void TestEpochCompletesExactlyOnceWhenAllAck() {
  auto         manifest = NewManifest();
  EpochManager epochs(manifest);
  epochs.Recover();

  auto request = epochs.Trigger({"w-1", "w-2"}, kStart);
  assert(request.has_value());
  assert(request->epoch == 1);
  assert(manifest->Epoch(1)->state() == EPOCH_STATE_SNAPSHOT_REQUESTED);

  epochs.OnBarrierSent(1);
  assert(manifest->Epoch(1)->state() == EPOCH_STATE_COLLECTING_ACKS);

  assert(epochs.OnAck(1, Record("w-1", 1), kStart + 10ms) == AckOutcome::kRecorded);
  assert(epochs.OnAck(1, Record("w-1", 1), kStart + 11ms) == AckOutcome::kRecorded);
  assert(epochs.OnAck(1, Record("w-2", 1), kStart + 20ms) == AckOutcome::kCompleted);

  // Late duplicate after completion does nothing.
  assert(epochs.OnAck(1, Record("w-2", 1), kStart + 30ms) == AckOutcome::kIgnored);

  auto entry = manifest->Epoch(1);
  assert(entry->state() == EPOCH_STATE_COMPLETE);
  assert(entry->records_size() == 2);
  assert(epochs.LatestComplete() == 1);
  assert(manifest->CompletedEpochs().size() == 1);
}

void TestEpochNumbersStrictlyIncrease() {
  auto         manifest = NewManifest();
  EpochManager epochs(manifest);
  epochs.Recover();

  uint64_t last = 0;
  for (int round = 0; round < 5; ++round) {
    auto request = epochs.Trigger({"w-1"}, kStart);
    assert(request.has_value());
    assert(request->epoch > last);
    last = request->epoch;
    epochs.OnBarrierSent(request->epoch);
    assert(epochs.OnAck(request->epoch, Record("w-1", request->epoch), kStart) == AckOutcome::kCompleted);
  }
  assert(last == 5);
}

void TestOnlyOneEpochInFlight() {
  auto         manifest = NewManifest();
  EpochManager epochs(manifest);
  epochs.Recover();

  assert(epochs.Trigger({"w-1"}, kStart).has_value());
  assert(!epochs.Trigger({"w-1"}, kStart + 1s).has_value());
  assert(epochs.StalledFor(kStart + 1s) == 1000);

  auto view = epochs.View(kStart + 2s);
  assert(view.current_epoch == 1);
  assert(view.missing_acks.size() == 1);
  assert(view.pending_ms == 2000);
}

void TestNoTriggerWithoutAliveWorkers() {
  auto         manifest = NewManifest();
  EpochManager epochs(manifest);
  epochs.Recover();

  assert(!epochs.Trigger({}, kStart).has_value());
  assert(manifest->Empty());
}

void TestDeadWorkerShrinksRequiredSet() {
  auto         manifest = NewManifest();
  EpochManager epochs(manifest);
  epochs.Recover();

  // Bring numbering to epoch 10.
  for (uint64_t e = 1; e < 10; ++e) {
    auto request = epochs.Trigger({"w-1"}, kStart);
    epochs.OnAck(request->epoch, Record("w-1", request->epoch), kStart);
  }

  auto request = epochs.Trigger({"w-1", "w-2", "w-3"}, kStart);
  assert(request->epoch == 10);
  epochs.OnBarrierSent(10);

  assert(epochs.OnAck(10, Record("w-1", 10), kStart + 1ms) == AckOutcome::kRecorded);
  assert(epochs.OnAck(10, Record("w-2", 10), kStart + 2ms) == AckOutcome::kRecorded);
  assert(epochs.OnWorkerDead("w-3", kStart + 6s) == DeathOutcome::kCompleted);

  auto entry = manifest->Epoch(10);
  assert(entry->state() == EPOCH_STATE_COMPLETE);
  assert(entry->records_size() == 2);
  assert(entry->required_workers_size() == 2);
}

void TestAckedWorkerDeathKeepsItsRecord() {
  auto         manifest = NewManifest();
  EpochManager epochs(manifest);
  epochs.Recover();

  epochs.Trigger({"w-1", "w-2"}, kStart);
  epochs.OnAck(1, Record("w-1", 1), kStart);
  assert(epochs.OnWorkerDead("w-1", kStart) == DeathOutcome::kIgnored);
  assert(epochs.InFlight());

  assert(epochs.OnAck(1, Record("w-2", 1), kStart) == AckOutcome::kCompleted);
  assert(manifest->Epoch(1)->records_size() == 2);
}

void TestAllRequiredDeadAbandonsEpoch() {
  auto         manifest = NewManifest();
  EpochManager epochs(manifest);
  epochs.Recover();

  epochs.Trigger({"w-1", "w-2"}, kStart);
  assert(epochs.OnWorkerDead("w-1", kStart) == DeathOutcome::kShrunk);
  assert(epochs.OnWorkerDead("w-2", kStart) == DeathOutcome::kAbandoned);
  assert(manifest->Epoch(1)->state() == EPOCH_STATE_INCOMPLETE);
  assert(!epochs.InFlight());

  // Never retried as the same epoch.
  auto next = epochs.Trigger({"w-3"}, kStart);
  assert(next->epoch == 2);
  assert(epochs.OnAck(1, Record("w-3", 1), kStart) == AckOutcome::kIgnored);
}

void TestAcksOutsideTheEpochAreIgnored() {
  auto         manifest = NewManifest();
  EpochManager epochs(manifest);
  epochs.Recover();

  epochs.Trigger({"w-1"}, kStart);
  assert(epochs.OnAck(2, Record("w-1", 2), kStart) == AckOutcome::kIgnored);
  assert(epochs.OnAck(1, Record("w-9", 1), kStart) == AckOutcome::kIgnored);
  assert(epochs.OnAck(1, Record("w-1", 7), kStart) == AckOutcome::kIgnored);
  assert(epochs.InFlight());
}

void TestRecoverAbandonsPendingAndResumesNumbering() {
  auto manifest = NewManifest();
  {
    EpochManager epochs(manifest);
    epochs.Recover();
    epochs.Trigger({"w-1"}, kStart);
    epochs.OnAck(1, Record("w-1", 1), kStart);
    epochs.Trigger({"w-1"}, kStart);
    epochs.OnBarrierSent(2);
  }

  EpochManager restarted(manifest);
  restarted.Recover();
  assert(manifest->Epoch(2)->state() == EPOCH_STATE_INCOMPLETE);
  assert(restarted.LatestComplete() == 1);
  assert(restarted.NextEpoch() == 3);
  assert(restarted.Trigger({"w-1"}, kStart)->epoch == 3);
}

void TestRecoverSkipsEpochsAlreadyInTheStore() {
  // Fresh manifest, but a previous deployment left coordinated/<w>/...7.snap.
  auto         manifest = NewManifest();
  EpochManager epochs(manifest);
  epochs.Recover(7);
  assert(epochs.NextEpoch() == 8);
  assert(epochs.Trigger({"w-1"}, kStart)->epoch == 8);

  // The manifest wins when it is ahead of the store.
  EpochManager again(manifest);
  again.Recover(2);
  assert(again.NextEpoch() == 9);
}

} // namespace

int main() {
  TestEpochCompletesExactlyOnceWhenAllAck();
  TestEpochNumbersStrictlyIncrease();
  TestOnlyOneEpochInFlight();
  TestNoTriggerWithoutAliveWorkers();
  TestDeadWorkerShrinksRequiredSet();
  TestAckedWorkerDeathKeepsItsRecord();
  TestAllRequiredDeadAbandonsEpoch();
  TestAcksOutsideTheEpochAreIgnored();
  TestRecoverAbandonsPendingAndResumesNumbering();
  TestRecoverSkipsEpochsAlreadyInTheStore();

  std::cout << "checkpoint_unit_epoch_manager: pass\n";
  return 0;
}
