#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "checkpoint/manager/v1_types.hpp"
#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"

namespace checkpoint::db {

/*
  Durable backing of the snapshot manifest.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Records are stored whole; nothing is patched in place

  Coordinated epochs are keyed by epoch number. Uncoordinated records are
  keyed by (worker_id, sequence) and listed in sequence order.
*/

class ManifestRepository {
 public:
  virtual ~ManifestRepository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Coordinated epochs
  // ---------------------------------------------------------------------

  virtual Result UpsertEpoch(Transaction&, const manager::v1::ManifestEntry&) = 0;

  virtual std::optional<manager::v1::ManifestEntry> GetEpoch(Transaction&, uint64_t epoch) = 0;

  // ascending by epoch
  virtual std::vector<manager::v1::ManifestEntry> ListEpochs(Transaction&) = 0;

  virtual Result DeleteEpochsBelow(Transaction&, uint64_t epoch) = 0;

  // ---------------------------------------------------------------------
  // Uncoordinated per-worker records
  // ---------------------------------------------------------------------

  // AlreadyExists when (worker_id, generation) is present.
  virtual Result InsertLocalRecord(Transaction&, const manager::v1::SnapshotRecord&) = 0;

  // ascending by generation
  virtual std::vector<manager::v1::SnapshotRecord> ListLocalRecords(Transaction&, const std::string& worker_id) = 0;

  virtual std::vector<std::string> ListLocalWorkers(Transaction&) = 0;

  virtual Result DeleteLocalRecordsBelow(Transaction&, const std::string& worker_id, uint64_t generation) = 0;
};

using ManifestRepositoryPtr = std::shared_ptr<ManifestRepository>;

} // namespace checkpoint::db
