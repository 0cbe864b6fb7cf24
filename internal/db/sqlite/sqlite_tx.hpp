#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace checkpoint::db::sqlite {

/*
  BEGIN IMMEDIATE transaction. The write lock is taken up front so a
  manifest update never fails halfway on SQLITE_BUSY.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;

 private:
  std::shared_ptr<SqliteDB> db_;
};

} // namespace checkpoint::db::sqlite
