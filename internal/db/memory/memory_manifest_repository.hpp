#pragma once

#include <map>
#include <mutex>
#include <string>

#include "internal/db/api/manifest_repository.hpp"

namespace checkpoint::db::memory {

class MemoryTransaction;

class MemoryManifestRepository final : public db::ManifestRepository {
 public:
  MemoryManifestRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                                    UpsertEpoch(Transaction&, const manager::v1::ManifestEntry&) override;
  std::optional<manager::v1::ManifestEntry> GetEpoch(Transaction&, uint64_t) override;
  std::vector<manager::v1::ManifestEntry>   ListEpochs(Transaction&) override;
  Result                                    DeleteEpochsBelow(Transaction&, uint64_t) override;

  Result                                   InsertLocalRecord(Transaction&, const manager::v1::SnapshotRecord&) override;
  std::vector<manager::v1::SnapshotRecord> ListLocalRecords(Transaction&, const std::string&) override;
  std::vector<std::string>                 ListLocalWorkers(Transaction&) override;
  Result                                   DeleteLocalRecordsBelow(Transaction&, const std::string&, uint64_t) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::map<uint64_t, manager::v1::ManifestEntry>                         epochs;
    std::map<std::string, std::map<uint64_t, manager::v1::SnapshotRecord>> local;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace checkpoint::db::memory
