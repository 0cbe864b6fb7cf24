#include "internal/db/sqlite/sqlite_db.hpp"

#include <stdexcept>
#include <utility>

namespace checkpoint::db::sqlite {
namespace {

constexpr int kBusyTimeoutMs = 5000;

[[noreturn]] void Fail(sqlite3* db, const std::string& what) {
  throw std::runtime_error("manifest db " + what + ": " + (db ? sqlite3_errmsg(db) : "no connection"));
}

} // namespace

Statement::Statement(sqlite3* db, const char* sql) {
  if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st_);
    st_ = nullptr;
  }
}

Statement::~Statement() {
  if (st_) sqlite3_finalize(st_);
}

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  if (path_.empty()) {
    throw std::invalid_argument("manifest db path must not be empty");
  }

  const int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    const std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("manifest db open " + path_ + ": " + msg);
  }

  try {
    Configure(wal_mode);
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errmsg(db_);
    sqlite3_free(err);
    throw std::runtime_error("manifest db exec: " + msg);
  }
}

int64_t SqliteDB::SchemaVersion() {
  Statement st(db_, "PRAGMA user_version;");
  if (!st) Fail(db_, "prepare user_version");
  if (sqlite3_step(st.get()) != SQLITE_ROW) Fail(db_, "read user_version");
  return sqlite3_column_int64(st.get(), 0);
}

void SqliteDB::SetSchemaVersion(int64_t version) {
  Exec("PRAGMA user_version=" + std::to_string(version) + ";");
}

void SqliteDB::Configure(bool wal_mode) {
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }
  Exec("PRAGMA synchronous=FULL;");
  Exec("PRAGMA foreign_keys=ON;");

  if (sqlite3_busy_timeout(db_, kBusyTimeoutMs) != SQLITE_OK) {
    Fail(db_, "busy_timeout");
  }
}

} // namespace checkpoint::db::sqlite
