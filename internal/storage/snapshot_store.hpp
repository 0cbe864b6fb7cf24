#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/storage/common/key_layout.hpp"

namespace checkpoint::storage {

enum class StoreKind {
  kRam,
  kDisk,
  kObject,
};

inline std::string_view ToString(StoreKind kind) {
  switch (kind) {
    case StoreKind::kRam:
      return "ram";
    case StoreKind::kDisk:
      return "disk";
    case StoreKind::kObject:
      return "object";
  }
  return "unknown";
}

/*
  Durable blob store for snapshot images.

  Every snapshot is an Arrow Buffer addressed by a key from key_layout.hpp.

  Contract:
    - Put is atomic: a partially written object is never visible to Get or List.
    - Keys are unique per generation; history is never overwritten.
    - List returns keys in lexical order, which key_layout makes equal to
      creation order for one worker.

  Implementations:
    RAM      → in-process map (tests, single node)
    DISK     → local directory, tmp + link
    OBJECT   → Arrow filesystem (S3 / MinIO)
*/
class SnapshotStore {
 public:
  virtual ~SnapshotStore() = default;

  // Throws util::AlreadyExists when the key is taken and
  // util::StorageWriteFailure when the backend rejects the write.
  virtual void Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) = 0;

  // Throws util::NotFound when the key does not exist.
  virtual std::shared_ptr<arrow::Buffer> Get(const std::string& key) = 0;

  virtual std::vector<std::string> List(const std::string& prefix) = 0;

  /*
    Delete one object.

    Removing an absent key succeeds so a compaction pass interrupted
    midway can simply be run again.
  */
  virtual void Remove(const std::string& key) = 0;

  virtual StoreKind Kind() const = 0;
};

using SnapshotStorePtr = std::shared_ptr<SnapshotStore>;

// Highest generation stored under `prefix`; 0 when there is none.
inline uint64_t HighestGeneration(SnapshotStore& store, const std::string& prefix) {
  uint64_t highest = 0;
  for (const auto& key : store.List(prefix)) {
    auto parsed = common::ParseSnapshotKey(key);
    if (parsed && parsed->generation > highest) highest = parsed->generation;
  }
  return highest;
}

} // namespace checkpoint::storage
