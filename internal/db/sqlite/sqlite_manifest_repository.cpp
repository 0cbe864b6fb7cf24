#include "internal/db/sqlite/sqlite_manifest_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>

namespace checkpoint::db::sqlite {

using checkpoint::db::ErrorCode;
using checkpoint::db::Result;
using namespace checkpoint::manager::v1;

namespace {

constexpr int64_t kManifestSchemaVersion = 1;

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& bytes) {
  sqlite3_bind_blob(st, idx, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  const int   size = sqlite3_column_bytes(st, col);
  return data ? std::string(static_cast<const char*>(data), static_cast<size_t>(size)) : std::string{};
}

template <typename Message>
Message ParseOrThrow(const std::string& bytes, const char* what) {
  Message message;
  if (!message.ParseFromString(bytes)) {
    throw std::runtime_error(std::string("corrupt manifest row: ") + what);
  }
  return message;
}

} // namespace

SqliteManifestRepository::SqliteManifestRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteManifestRepository::BootstrapSchema(SqliteDB& db) {
  const auto version = db.SchemaVersion();
  if (version > kManifestSchemaVersion) {
    throw std::runtime_error(db.Path() + ": manifest schema version " + std::to_string(version) + " is newer than supported version " +
                             std::to_string(kManifestSchemaVersion));
  }
  if (version == kManifestSchemaVersion) {
    return;
  }

  db.Exec("BEGIN IMMEDIATE;");
  try {
    db.Exec(
        "CREATE TABLE IF NOT EXISTS manifest_epochs ("
        "epoch INTEGER PRIMARY KEY, state INTEGER NOT NULL, entry BLOB NOT NULL);");
    db.Exec(
        "CREATE TABLE IF NOT EXISTS local_snapshots ("
        "worker_id TEXT NOT NULL, generation INTEGER NOT NULL, record BLOB NOT NULL, "
        "PRIMARY KEY (worker_id, generation));");
    db.SetSchemaVersion(kManifestSchemaVersion);
    db.Exec("COMMIT;");
  } catch (...) {
    sqlite3_exec(db.Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
    throw;
  }
}

std::unique_ptr<db::Transaction> SqliteManifestRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteManifestRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteManifestRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Coordinated epochs
// ------------------------------------------------------------------

Result SqliteManifestRepository::UpsertEpoch(Transaction& t, const ManifestEntry& entry) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO manifest_epochs(epoch,state,entry) VALUES(?,?,?) "
               "ON CONFLICT(epoch) DO UPDATE SET state=excluded.state, entry=excluded.entry;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, entry.epoch());
  sqlite3_bind_int(st.get(), 2, static_cast<int>(entry.state()));
  BindBlob(st.get(), 3, entry.SerializeAsString());

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<ManifestEntry> SqliteManifestRepository::GetEpoch(Transaction& t, uint64_t epoch) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT entry FROM manifest_epochs WHERE epoch=?;");
  if (!st) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

  BindU64(st.get(), 1, epoch);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  return ParseOrThrow<ManifestEntry>(ColBlob(st.get(), 0), "manifest_epochs");
}

std::vector<ManifestEntry> SqliteManifestRepository::ListEpochs(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT entry FROM manifest_epochs ORDER BY epoch ASC;");
  if (!st) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

  std::vector<ManifestEntry> out;
  int                        rc = SQLITE_OK;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ParseOrThrow<ManifestEntry>(ColBlob(st.get(), 0), "manifest_epochs"));
  }
  if (rc != SQLITE_DONE) throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  return out;
}

Result SqliteManifestRepository::DeleteEpochsBelow(Transaction& t, uint64_t epoch) {
  auto* db = TX(t).Handle();

  Statement st(db, "DELETE FROM manifest_epochs WHERE epoch < ?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, epoch);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Uncoordinated records
// ------------------------------------------------------------------

Result SqliteManifestRepository::InsertLocalRecord(Transaction& t, const SnapshotRecord& record) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO local_snapshots(worker_id,generation,record) VALUES(?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, record.worker_id());
  BindU64(st.get(), 2, record.generation());
  BindBlob(st.get(), 3, record.SerializeAsString());

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return Result::Ok();
  return Translate(db, sqlite3_extended_errcode(db));
}

std::vector<SnapshotRecord> SqliteManifestRepository::ListLocalRecords(Transaction& t, const std::string& worker_id) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT record FROM local_snapshots WHERE worker_id=? ORDER BY generation ASC;");
  if (!st) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

  BindText(st.get(), 1, worker_id);

  std::vector<SnapshotRecord> out;
  int                         rc = SQLITE_OK;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ParseOrThrow<SnapshotRecord>(ColBlob(st.get(), 0), "local_snapshots"));
  }
  if (rc != SQLITE_DONE) throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  return out;
}

std::vector<std::string> SqliteManifestRepository::ListLocalWorkers(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT DISTINCT worker_id FROM local_snapshots ORDER BY worker_id ASC;");
  if (!st) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

  std::vector<std::string> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ColText(st.get(), 0));
  }
  return out;
}

Result SqliteManifestRepository::DeleteLocalRecordsBelow(Transaction& t, const std::string& worker_id, uint64_t generation) {
  auto* db = TX(t).Handle();

  Statement st(db, "DELETE FROM local_snapshots WHERE worker_id=? AND generation < ?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, worker_id);
  BindU64(st.get(), 2, generation);
  return Translate(db, sqlite3_step(st.get()));
}

} // namespace checkpoint::db::sqlite
