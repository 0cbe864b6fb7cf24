#include "internal/storage/ram/ram_snapshot_store.hpp"

#include <mutex>

#include "internal/storage/common/key_layout.hpp"
#include "internal/util/errors.hpp"

namespace checkpoint::storage {

void RamSnapshotStore::Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) {
  common::ValidateKey(key);
  if (!buffer) {
    throw std::invalid_argument("snapshot buffer must not be null");
  }

  // Own a private copy so later mutation of the caller's memory is invisible.
  auto copy = arrow::Buffer::FromString(buffer->ToString());

  std::unique_lock lock(mutex_);
  if (!buffers_.emplace(key, std::move(copy)).second) {
    throw util::AlreadyExists("snapshot object already exists: " + key);
  }
}

std::shared_ptr<arrow::Buffer> RamSnapshotStore::Get(const std::string& key) {
  std::shared_lock lock(mutex_);

  auto it = buffers_.find(key);
  if (it == buffers_.end()) throw util::NotFound("snapshot object not found: " + key);

  return it->second;
}

std::vector<std::string> RamSnapshotStore::List(const std::string& prefix) {
  std::shared_lock lock(mutex_);

  std::vector<std::string> keys;
  for (auto it = buffers_.lower_bound(prefix); it != buffers_.end(); ++it) {
    if (it->first.compare(0, prefix.size(), prefix) != 0) break;
    keys.push_back(it->first);
  }
  return keys;
}

void RamSnapshotStore::Remove(const std::string& key) {
  std::unique_lock lock(mutex_);
  buffers_.erase(key);
}

} // namespace checkpoint::storage
