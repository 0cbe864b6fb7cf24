#include "internal/db/memory/memory_tx.hpp"

#include <stdexcept>

namespace checkpoint::db::memory {

MemoryTransaction::MemoryTransaction(MemoryManifestRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_      = repo_.committed_;
  base_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (Active()) {
    Rollback();
  }
}

MemoryManifestRepository::State& MemoryTransaction::Mutable() {
  RequireActive("write");
  dirty_ = true;
  return working_;
}

void MemoryTransaction::Commit() {
  RequireActive("commit");

  // read-only transactions never conflict
  if (!dirty_) {
    state_ = State::kCommitted;
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != base_version_) {
    state_ = State::kRolledBack;
    throw std::runtime_error("manifest transaction conflict: another writer committed first");
  }
  repo_.committed_ = std::move(working_);
  ++repo_.committed_version_;
  state_ = State::kCommitted;
}

void MemoryTransaction::Rollback() {
  RequireActive("rollback");
  state_ = State::kRolledBack;
}

} // namespace checkpoint::db::memory
