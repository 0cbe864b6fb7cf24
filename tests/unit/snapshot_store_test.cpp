#include <arrow/buffer.h>
#include <arrow/filesystem/localfs.h>

#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "internal/storage/common/key_layout.hpp"
#include "internal/storage/disk/disk_snapshot_store.hpp"
#include "internal/storage/object/object_snapshot_store.hpp"
#include "internal/storage/ram/ram_snapshot_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using checkpoint::storage::SnapshotStore;
using checkpoint::storage::common::SnapshotKey;
using checkpoint::storage::common::WorkerPrefix;
using namespace checkpoint::manager::v1;

std::filesystem::path FreshDir(const std::string& name) {
  auto dir = std::filesystem::temp_directory_path() / "checkpoint_snapshot_store_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

void ExpectRoundTripIsByteIdentical(SnapshotStore& store) {
  std::string bytes("snap\0shot\xff\x01", 11);
  const auto  key = SnapshotKey(STRATEGY_COORDINATED, "w-1", 3);

  store.Put(key, arrow::Buffer::FromString(bytes));
  auto read = store.Get(key);
  assert(read->ToString() == bytes);
}

void ExpectListReturnsOneWorkerInCreationOrder(SnapshotStore& store) {
  for (uint64_t seq : {1, 2, 9, 10, 100}) {
    store.Put(SnapshotKey(STRATEGY_UNCOORDINATED, "w-1", seq), arrow::Buffer::FromString("x"));
  }
  store.Put(SnapshotKey(STRATEGY_UNCOORDINATED, "w-10", 5), arrow::Buffer::FromString("y"));

  auto keys = store.List(WorkerPrefix(STRATEGY_UNCOORDINATED, "w-1"));
  assert(keys.size() == 5);
  uint64_t previous = 0;
  for (const auto& key : keys) {
    auto parsed = checkpoint::storage::common::ParseSnapshotKey(key);
    assert(parsed.has_value());
    assert(parsed->worker_id == "w-1");
    assert(parsed->generation > previous);
    previous = parsed->generation;
  }
}

void ExpectMissingKeyIsNotFoundAndRemoveIsIdempotent(SnapshotStore& store) {
  const auto key = SnapshotKey(STRATEGY_COORDINATED, "w-2", 1);

  bool thrown = false;
  try {
    store.Get(key);
  } catch (const checkpoint::util::NotFound&) {
    thrown = true;
  }
  assert(thrown);

  store.Put(key, arrow::Buffer::FromString("z"));
  store.Remove(key);
  store.Remove(key);
  assert(store.List(WorkerPrefix(STRATEGY_COORDINATED, "w-2")).empty());
}

void ExpectExistingKeyIsNeverOverwritten(SnapshotStore& store) {
  const auto key = SnapshotKey(STRATEGY_COORDINATED, "w-3", 1);
  store.Put(key, arrow::Buffer::FromString("first"));

  bool thrown = false;
  try {
    store.Put(key, arrow::Buffer::FromString("second"));
  } catch (const checkpoint::util::AlreadyExists&) {
    thrown = true;
  }
  assert(thrown);
  assert(store.Get(key)->ToString() == "first");
  assert(store.List(WorkerPrefix(STRATEGY_COORDINATED, "w-3")).size() == 1);

  // A removed generation may be written again.
  store.Remove(key);
  store.Put(key, arrow::Buffer::FromString("third"));
  assert(store.Get(key)->ToString() == "third");
}

void TestRamStore() {
  checkpoint::storage::RamSnapshotStore store;
  ExpectRoundTripIsByteIdentical(store);
  ExpectListReturnsOneWorkerInCreationOrder(store);
  ExpectMissingKeyIsNotFoundAndRemoveIsIdempotent(store);
  ExpectExistingKeyIsNeverOverwritten(store);
}

void TestRamStoreCopiesOnPut() {
  checkpoint::storage::RamSnapshotStore store;
  std::string                           bytes = "original";
  auto                                  key   = SnapshotKey(STRATEGY_COORDINATED, "w-1", 1);
  {
    auto buffer = arrow::Buffer::FromString(bytes);
    store.Put(key, buffer);
  }
  assert(store.Get(key)->ToString() == "original");
}

void TestDiskStore() {
  checkpoint::storage::DiskSnapshotStore store(FreshDir("disk"), false);
  ExpectRoundTripIsByteIdentical(store);
  ExpectListReturnsOneWorkerInCreationOrder(store);
  ExpectMissingKeyIsNotFoundAndRemoveIsIdempotent(store);
  ExpectExistingKeyIsNeverOverwritten(store);
}

void TestDiskStoreNeverListsTemporaries() {
  auto                                   root = FreshDir("tmp_files");
  checkpoint::storage::DiskSnapshotStore store(root, true);

  const auto key = SnapshotKey(STRATEGY_COORDINATED, "w-1", 7);
  store.Put(key, arrow::Buffer::FromString("done"));

  // Leftover from a write interrupted before its rename.
  std::ofstream(root / (SnapshotKey(STRATEGY_COORDINATED, "w-1", 8) + ".tmp")) << "partial";

  auto keys = store.List(WorkerPrefix(STRATEGY_COORDINATED, "w-1"));
  assert(keys.size() == 1);
  assert(keys[0] == key);
}

void TestObjectStoreOnLocalFilesystem() {
  auto                                     root = FreshDir("object");
  checkpoint::storage::ObjectSnapshotStore store(std::make_shared<arrow::fs::LocalFileSystem>(), root.string());
  ExpectRoundTripIsByteIdentical(store);
  ExpectListReturnsOneWorkerInCreationOrder(store);
  ExpectMissingKeyIsNotFoundAndRemoveIsIdempotent(store);
  ExpectExistingKeyIsNeverOverwritten(store);

  // Writes are staged and moved, so nothing is left beside the object.
  const auto key = SnapshotKey(STRATEGY_COORDINATED, "w-4", 2);
  store.Put(key, arrow::Buffer::FromString("done"));
  assert(std::filesystem::is_regular_file(root / key));
  assert(!std::filesystem::exists(root / (key + ".tmp")));

  // Leftover from a write interrupted before its move.
  std::ofstream(root / (SnapshotKey(STRATEGY_COORDINATED, "w-4", 3) + ".tmp")) << "partial";
  auto keys = store.List(WorkerPrefix(STRATEGY_COORDINATED, "w-4"));
  assert(keys.size() == 1);
  assert(keys[0] == key);
}

void TestKeysEscapingTheRootAreRejected() {
  checkpoint::storage::DiskSnapshotStore store(FreshDir("escape"), false);

  bool thrown = false;
  try {
    store.Put("../outside.snap", arrow::Buffer::FromString("x"));
  } catch (const std::invalid_argument&) {
    thrown = true;
  }
  assert(thrown);

  thrown = false;
  try {
    SnapshotKey(STRATEGY_COORDINATED, "..", 1);
  } catch (const std::invalid_argument&) {
    thrown = true;
  }
  assert(thrown);
}

void TestKeyLayoutParsesOwnKeysOnly() {
  auto parsed = checkpoint::storage::common::ParseSnapshotKey(SnapshotKey(STRATEGY_UNCOORDINATED, "w-3", 42));
  assert(parsed.has_value());
  assert(parsed->strategy == STRATEGY_UNCOORDINATED);
  assert(parsed->worker_id == "w-3");
  assert(parsed->generation == 42);

  assert(!checkpoint::storage::common::ParseSnapshotKey("coordinated/w-3/42.snap").has_value());
  assert(!checkpoint::storage::common::ParseSnapshotKey("other/w-3/00000000000000000042.snap").has_value());
  assert(SnapshotKey(STRATEGY_COORDINATED, "w-1", 9) == "coordinated/w-1/00000000000000000009.snap");
  assert(checkpoint::storage::common::IsTemporaryKey(SnapshotKey(STRATEGY_COORDINATED, "w-1", 9) + ".tmp"));
}

void TestKeyLayoutRejectsGenerationsPastUint64() {
  using checkpoint::storage::common::ParseSnapshotKey;

  auto max = ParseSnapshotKey("coordinated/w-1/18446744073709551615.snap");
  assert(max.has_value());
  assert(max->generation == UINT64_MAX);
  assert(SnapshotKey(STRATEGY_COORDINATED, "w-1", UINT64_MAX) == "coordinated/w-1/18446744073709551615.snap");

  assert(!ParseSnapshotKey("coordinated/w-1/18446744073709551616.snap").has_value());
  assert(!ParseSnapshotKey("coordinated/w-1/99999999999999999999.snap").has_value());
}

void TestHighestGenerationScansOnlyThePrefix() {
  checkpoint::storage::RamSnapshotStore store;
  assert(checkpoint::storage::HighestGeneration(store, "coordinated/") == 0);

  store.Put(SnapshotKey(STRATEGY_COORDINATED, "w-1", 4), arrow::Buffer::FromString("x"));
  store.Put(SnapshotKey(STRATEGY_COORDINATED, "w-2", 11), arrow::Buffer::FromString("x"));
  store.Put(SnapshotKey(STRATEGY_UNCOORDINATED, "w-1", 90), arrow::Buffer::FromString("x"));

  assert(checkpoint::storage::HighestGeneration(store, "coordinated/") == 11);
  assert(checkpoint::storage::HighestGeneration(store, WorkerPrefix(STRATEGY_COORDINATED, "w-1")) == 4);
}

} // namespace

int main() {
  TestRamStore();
  TestRamStoreCopiesOnPut();
  TestDiskStore();
  TestDiskStoreNeverListsTemporaries();
  TestObjectStoreOnLocalFilesystem();
  TestKeysEscapingTheRootAreRejected();
  TestKeyLayoutParsesOwnKeysOnly();
  TestKeyLayoutRejectsGenerationsPastUint64();
  TestHighestGenerationScansOnlyThePrefix();

  std::cout << "checkpoint_unit_snapshot_store: pass\n";
  return 0;
}
