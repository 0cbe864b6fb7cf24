#include "internal/worker/partition_state_store.hpp"

namespace checkpoint::worker {

using namespace checkpoint::manager::v1;

bool PartitionStateStore::Advance(const std::string& partition, uint64_t offset) {
  auto& next = next_offsets_[partition];
  if (offset < next) return false;
  next = offset + 1;
  return true;
}

bool PartitionStateStore::Apply(const std::string& partition, const std::string& key, const std::string& value, uint64_t offset) {
  std::lock_guard lock(mutex_);
  if (!Advance(partition, offset)) return false;
  partitions_[partition][key] = value;
  return true;
}

bool PartitionStateStore::Erase(const std::string& partition, const std::string& key, uint64_t offset) {
  std::lock_guard lock(mutex_);
  if (!Advance(partition, offset)) return false;
  auto it = partitions_.find(partition);
  if (it != partitions_.end()) it->second.erase(key);
  return true;
}

std::optional<std::string> PartitionStateStore::Get(const std::string& partition, const std::string& key) const {
  std::lock_guard lock(mutex_);
  auto            it = partitions_.find(partition);
  if (it == partitions_.end()) return std::nullopt;
  auto entry = it->second.find(key);
  if (entry == it->second.end()) return std::nullopt;
  return entry->second;
}

CapturedState PartitionStateStore::Capture() {
  auto image = std::make_shared<PartitionImage>();

  CapturedState captured;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [partition, entries] : partitions_) {
      auto* state = image->add_partitions();
      state->set_partition(partition);
      state->mutable_entries()->insert(entries.begin(), entries.end());
    }
    for (const auto& [partition, next] : next_offsets_) {
      PartitionOffset offset;
      offset.set_partition(partition);
      offset.set_offset(next);
      captured.offsets.push_back(std::move(offset));
    }
  }

  captured.image = std::move(image);
  return captured;
}

void PartitionStateStore::Restore(const PartitionImage& image, const std::vector<PartitionOffset>& offsets) {
  std::map<std::string, std::map<std::string, std::string>> partitions;
  for (const auto& state : image.partitions()) {
    partitions[state.partition()].insert(state.entries().begin(), state.entries().end());
  }
  std::map<std::string, uint64_t> next_offsets;
  for (const auto& offset : offsets) {
    next_offsets[offset.partition()] = offset.offset();
  }

  std::lock_guard lock(mutex_);
  partitions_   = std::move(partitions);
  next_offsets_ = std::move(next_offsets);
}

std::vector<PartitionOffset> PartitionStateStore::Offsets() const {
  std::lock_guard              lock(mutex_);
  std::vector<PartitionOffset> out;
  for (const auto& [partition, next] : next_offsets_) {
    PartitionOffset offset;
    offset.set_partition(partition);
    offset.set_offset(next);
    out.push_back(std::move(offset));
  }
  return out;
}

uint64_t PartitionStateStore::NextOffset(const std::string& partition) const {
  std::lock_guard lock(mutex_);
  auto            it = next_offsets_.find(partition);
  return it == next_offsets_.end() ? 0 : it->second;
}

size_t PartitionStateStore::Size() const {
  std::lock_guard lock(mutex_);
  size_t          total = 0;
  for (const auto& [_, entries] : partitions_) {
    total += entries.size();
  }
  return total;
}

} // namespace checkpoint::worker
