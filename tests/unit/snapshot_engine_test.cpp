#include <arrow/buffer.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/storage/common/key_layout.hpp"
#include "internal/storage/ram/ram_snapshot_store.hpp"
#include "internal/util/checksum.hpp"
#include "internal/util/errors.hpp"
#include "internal/worker/partition_state_store.hpp"
#include "internal/worker/snapshot_codec.hpp"
#include "internal/worker/snapshot_engine.hpp"

namespace {

using checkpoint::worker::PartitionStateStore;
using checkpoint::worker::SnapshotEngine;
using checkpoint::worker::SnapshotTrigger;
using namespace checkpoint::manager::v1;
using namespace std::chrono_literals;

checkpoint::util::RetryPolicy FastRetry(uint32_t attempts) {
  checkpoint::util::RetryPolicy policy;
  policy.max_attempts    = attempts;
  policy.initial_backoff = 1ms;
  policy.max_backoff     = 4ms;
  return policy;
}

// Delegates to an in-memory store; subclasses intercept Put.
class ForwardingStore : public checkpoint::storage::SnapshotStore {
 public:
  void Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) override {
    inner_.Put(key, buffer);
  }

  std::shared_ptr<arrow::Buffer> Get(const std::string& key) override {
    return inner_.Get(key);
  }

  std::vector<std::string> List(const std::string& prefix) override {
    return inner_.List(prefix);
  }

  void Remove(const std::string& key) override {
    inner_.Remove(key);
  }

  checkpoint::storage::StoreKind Kind() const override {
    return checkpoint::storage::StoreKind::kRam;
  }

 private:
  checkpoint::storage::RamSnapshotStore inner_;
};

// Rejects the first `failures` writes.
class FlakyStore final : public ForwardingStore {
 public:
  explicit FlakyStore(int failures) : failures_(failures) {
  }

  void Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) override {
    ++attempts;
    if (failures_ > 0) {
      --failures_;
      throw checkpoint::util::StorageWriteFailure("injected");
    }
    ForwardingStore::Put(key, buffer);
  }

  int attempts = 0;

 private:
  int failures_;
};

// Holds every Put until released.
class GatedStore final : public ForwardingStore {
 public:
  void Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) override {
    std::unique_lock lock(mutex_);
    entered_ = true;
    cv_.notify_all();
    cv_.wait(lock, [&] { return open_; });
    lock.unlock();
    ForwardingStore::Put(key, buffer);
  }

  void WaitEntered() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] { return entered_; });
  }

  void Open() {
    std::lock_guard lock(mutex_);
    open_ = true;
    cv_.notify_all();
  }

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    entered_ = false;
  bool                    open_    = false;
};

class BrokenSource final : public checkpoint::worker::SnapshotSource {
 public:
  checkpoint::worker::CapturedState Capture() override {
    throw std::runtime_error("state is not serializable");
  }
};

std::shared_ptr<PartitionStateStore> SeededState() {
  auto state = std::make_shared<PartitionStateStore>();
  state->Apply("p0", "a", "1", 0);
  state->Apply("p0", "b", "2", 1);
  state->Apply("p1", "c", "3", 0);
  return state;
}

void TestCoordinatedSnapshotIsVerifiable() {
  auto           store = std::make_shared<checkpoint::storage::RamSnapshotStore>();
  SnapshotEngine engine("w-1", SeededState(), store, FastRetry(1));

  auto record = engine.Snapshot(SnapshotTrigger::Coordinated(10));
  assert(record.has_value());
  assert(record->strategy() == STRATEGY_COORDINATED);
  assert(record->generation() == 10);
  assert(record->storage_key() == checkpoint::storage::common::SnapshotKey(STRATEGY_COORDINATED, "w-1", 10));

  auto blob = store->Get(record->storage_key());
  assert(static_cast<uint64_t>(blob->size()) == record->size_bytes());
  assert(checkpoint::util::Crc32c::Compute(blob->data(), static_cast<size_t>(blob->size())) == record->checksum());

  auto decoded = checkpoint::worker::DecodeSnapshot(*blob);
  assert(decoded.header.generation() == 10);
  assert(decoded.header.offsets_size() == 2);
  assert(decoded.image.partitions_size() == 2);

  // Coordinated snapshots do not consume local sequence numbers.
  assert(engine.NextSequence() == 1);
}

void TestWriteRetriesThenSucceeds() {
  auto           store = std::make_shared<FlakyStore>(2);
  SnapshotEngine engine("w-1", SeededState(), store, FastRetry(5));

  auto record = engine.Snapshot(SnapshotTrigger::Local());
  assert(record.has_value());
  assert(store->attempts == 3);
  assert(record->generation() == 1);
  assert(engine.NextSequence() == 2);
}

void TestExhaustedRetriesKeepPreviousBaseline() {
  auto           store = std::make_shared<FlakyStore>(100);
  SnapshotEngine engine("w-1", SeededState(), store, FastRetry(3));

  auto record = engine.Snapshot(SnapshotTrigger::Local());
  assert(!record.has_value());
  assert(store->attempts == 3);
  assert(engine.NextSequence() == 1);
  assert(!engine.InProgress());
  assert(store->List("uncoordinated/").empty());
}

void TestSerializationFailureIsFatal() {
  auto           store = std::make_shared<checkpoint::storage::RamSnapshotStore>();
  SnapshotEngine engine("w-1", std::make_shared<BrokenSource>(), store, FastRetry(1));

  bool thrown = false;
  try {
    engine.Snapshot(SnapshotTrigger::Local());
  } catch (const checkpoint::util::SerializationFailure&) {
    thrown = true;
  }
  assert(thrown);

  std::atomic<int> fatal{0};
  engine.SetFatalHandler([&](const std::exception&) { ++fatal; });
  engine.Start();
  assert(!engine.Submit(SnapshotTrigger::Coordinated(1)));
  assert(fatal == 1);
  assert(!engine.InProgress());
  engine.Stop();
}

void TestProcessingContinuesWhileWriteIsPending() {
  auto           store = std::make_shared<GatedStore>();
  auto           state = SeededState();
  SnapshotEngine engine("w-1", state, store, FastRetry(1));

  std::mutex                  sink_mutex;
  std::condition_variable     sink_cv;
  std::vector<SnapshotRecord> delivered;
  engine.SetCompletionSink([&](const SnapshotRecord& record) {
    std::lock_guard lock(sink_mutex);
    delivered.push_back(record);
    sink_cv.notify_all();
  });
  engine.Start();

  assert(engine.Submit(SnapshotTrigger::Coordinated(3)));
  store->WaitEntered();
  assert(engine.InProgress());

  // The durable write is stuck, the state is not.
  assert(state->Apply("p0", "d", "4", 2));
  assert(state->Get("p0", "d") == std::optional<std::string>("4"));

  store->Open();
  {
    std::unique_lock lock(sink_mutex);
    const bool done = sink_cv.wait_for(lock, 5s, [&] { return !delivered.empty(); });
    assert(done);
  }
  engine.Stop();

  // The image is the one captured at the barrier, without the later event.
  auto decoded = checkpoint::worker::DecodeSnapshot(*store->Get(delivered[0].storage_key()));
  for (const auto& partition : decoded.image.partitions()) {
    assert(partition.entries().count("d") == 0);
  }
  assert(delivered[0].generation() == 3);
}

void TestStaleBarriersAreIgnored() {
  auto           store = std::make_shared<checkpoint::storage::RamSnapshotStore>();
  SnapshotEngine engine("w-1", SeededState(), store, FastRetry(1));
  engine.Start();

  assert(engine.Submit(SnapshotTrigger::Coordinated(5)));
  assert(!engine.Submit(SnapshotTrigger::Coordinated(5)));
  assert(!engine.Submit(SnapshotTrigger::Coordinated(4)));
  assert(engine.Submit(SnapshotTrigger::Coordinated(6)));
  engine.Stop();

  auto keys = store->List(checkpoint::storage::common::WorkerPrefix(STRATEGY_COORDINATED, "w-1"));
  assert(keys.size() == 2);
}

void TestResumeSequenceSkipsExistingSnapshots() {
  auto store = std::make_shared<checkpoint::storage::RamSnapshotStore>();
  {
    SnapshotEngine engine("w-1", SeededState(), store, FastRetry(1));
    assert(engine.Snapshot(SnapshotTrigger::Local()).has_value());
    assert(engine.Snapshot(SnapshotTrigger::Local()).has_value());
  }

  SnapshotEngine restarted("w-1", SeededState(), store, FastRetry(1));
  assert(restarted.ResumeSequence() == 3);

  auto record = restarted.Snapshot(SnapshotTrigger::Local());
  assert(record.has_value());
  assert(record->generation() == 3);
  assert(store->List("uncoordinated/w-1/").size() == 3);
}

void TestTakenGenerationIsSkippedWithoutRetry() {
  auto store = std::make_shared<FlakyStore>(0);
  store->Put(checkpoint::storage::common::SnapshotKey(STRATEGY_UNCOORDINATED, "w-1", 1), arrow::Buffer::FromString("older run"));
  store->Put(checkpoint::storage::common::SnapshotKey(STRATEGY_COORDINATED, "w-1", 7), arrow::Buffer::FromString("older run"));
  store->attempts = 0;

  SnapshotEngine engine("w-1", SeededState(), store, FastRetry(5));

  assert(!engine.Snapshot(SnapshotTrigger::Local()).has_value());
  assert(store->attempts == 1);
  assert(engine.NextSequence() == 2);
  assert(store->Get("uncoordinated/w-1/00000000000000000001.snap")->ToString() == "older run");

  auto next = engine.Snapshot(SnapshotTrigger::Local());
  assert(next.has_value());
  assert(next->generation() == 2);

  assert(!engine.Snapshot(SnapshotTrigger::Coordinated(7)).has_value());
  assert(store->Get("coordinated/w-1/00000000000000000007.snap")->ToString() == "older run");
}

} // namespace

int main() {
  TestCoordinatedSnapshotIsVerifiable();
  TestWriteRetriesThenSucceeds();
  TestExhaustedRetriesKeepPreviousBaseline();
  TestSerializationFailureIsFatal();
  TestProcessingContinuesWhileWriteIsPending();
  TestStaleBarriersAreIgnored();
  TestResumeSequenceSkipsExistingSnapshots();
  TestTakenGenerationIsSkippedWithoutRetry();

  std::cout << "checkpoint_unit_snapshot_engine: pass\n";
  return 0;
}
