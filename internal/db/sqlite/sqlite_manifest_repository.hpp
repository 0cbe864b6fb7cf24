#pragma once

#include <memory>

#include "internal/db/api/manifest_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"

namespace checkpoint::db::sqlite {

/*
  Manifest persistence in SQLite.

  Entries and records are stored as serialized protobuf next to the
  columns used for ordering and range deletes.
*/
class SqliteManifestRepository final : public db::ManifestRepository {
 public:
  explicit SqliteManifestRepository(std::shared_ptr<SqliteDB> db);

  // Creates the manifest tables on first use; refuses a newer schema.
  static void BootstrapSchema(SqliteDB& db);

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
  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace checkpoint::db::sqlite
