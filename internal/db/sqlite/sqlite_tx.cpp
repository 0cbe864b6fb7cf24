#include "internal/db/sqlite/sqlite_tx.hpp"

namespace checkpoint::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  // no-op if sqlite already rolled back after an error
  if (Active() && sqlite3_get_autocommit(db_->Handle()) == 0) {
    sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
  }
}

void SqliteTransaction::Commit() {
  RequireActive("commit");
  db_->Exec("COMMIT;");
  state_ = State::kCommitted;
}

void SqliteTransaction::Rollback() {
  RequireActive("rollback");
  state_ = State::kRolledBack;
  db_->Exec("ROLLBACK;");
}

} // namespace checkpoint::db::sqlite
