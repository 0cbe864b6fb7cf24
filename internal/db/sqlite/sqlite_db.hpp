#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <string>

namespace checkpoint::db::sqlite {

/*
  Prepared statement owned for the duration of one call.
  Evaluates false when preparation failed; sqlite3_errmsg has the reason.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }
  explicit operator bool() const {
    return st_ != nullptr;
  }

 private:
  sqlite3_stmt* st_ = nullptr;
};

/*
  Connection to the coordinator's manifest database.

  The manifest is the only durable coordinator state, so the connection
  always runs with synchronous=FULL. WAL is optional.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Runs one or more statements without results. Throws on failure.
  void Exec(const std::string& sql);

  // PRAGMA user_version, used to stamp the manifest schema.
  int64_t SchemaVersion();
  void    SetSchemaVersion(int64_t version);

 private:
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace checkpoint::db::sqlite
