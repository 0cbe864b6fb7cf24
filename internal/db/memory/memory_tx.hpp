#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "internal/db/memory/memory_manifest_repository.hpp"

namespace checkpoint::db::memory {

/*
  Private copy of the manifest taken at Begin(). Commit() installs the copy
  only if no other transaction committed in between.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryManifestRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;

  MemoryManifestRepository::State& Mutable();
  const MemoryManifestRepository::State& View() const {
    return working_;
  }

 private:
  MemoryManifestRepository&       repo_;
  MemoryManifestRepository::State working_;
  uint64_t                        base_version_ = 0;
  bool                            dirty_        = false;
};

} // namespace checkpoint::db::memory
