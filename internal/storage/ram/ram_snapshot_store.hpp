#pragma once

#include <arrow/buffer.h>

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>

#include "internal/storage/snapshot_store.hpp"

namespace checkpoint::storage {

/*
  In-process snapshot store.

  Backed by Arrow buffers in an ordered map so List() is a range scan.

  Thread safety:
    - shared reads
    - exclusive writes
*/
class RamSnapshotStore final : public SnapshotStore {
 public:
  RamSnapshotStore()           = default;
  ~RamSnapshotStore() override = default;

  void Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) override;

  std::shared_ptr<arrow::Buffer> Get(const std::string& key) override;

  std::vector<std::string> List(const std::string& prefix) override;

  void Remove(const std::string& key) override;

  StoreKind Kind() const override {
    return StoreKind::kRam;
  }

 private:
  mutable std::shared_mutex                             mutex_;
  std::map<std::string, std::shared_ptr<arrow::Buffer>> buffers_;
};

} // namespace checkpoint::storage
