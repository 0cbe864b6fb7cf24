#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "checkpoint/manager/v1_types.hpp"

namespace checkpoint::worker {

struct CapturedState {
  std::shared_ptr<const manager::v1::PartitionImage> image;
  std::vector<manager::v1::PartitionOffset>          offsets;
};

/*
  Anything the snapshot engine can take an image of.
*/
class SnapshotSource {
 public:
  virtual ~SnapshotSource() = default;

  // Consistent image plus the replay offsets it corresponds to.
  virtual CapturedState Capture() = 0;
};

/*
  PartitionStateStore

  The worker's owned state:

      partition → key → bytes
      partition → next event-log offset to apply

  Capture() copies both under the state lock. That copy is the only pause
  event processing sees; serialization and the durable write run on the
  immutable image afterwards.
*/
class PartitionStateStore final : public SnapshotSource {
 public:
  // Returns false when `offset` was already applied.
  bool Apply(const std::string& partition, const std::string& key, const std::string& value, uint64_t offset);
  bool Erase(const std::string& partition, const std::string& key, uint64_t offset);

  std::optional<std::string> Get(const std::string& partition, const std::string& key) const;

  CapturedState Capture() override;

  // Replaces everything with a snapshot image. Offsets are next offsets.
  void Restore(const manager::v1::PartitionImage& image, const std::vector<manager::v1::PartitionOffset>& offsets);

  std::vector<manager::v1::PartitionOffset> Offsets() const;

  uint64_t NextOffset(const std::string& partition) const;

  size_t Size() const;

 private:
  bool Advance(const std::string& partition, uint64_t offset);

  mutable std::mutex                                        mutex_;
  std::map<std::string, std::map<std::string, std::string>> partitions_;
  std::map<std::string, uint64_t>                           next_offsets_;
};

} // namespace checkpoint::worker
