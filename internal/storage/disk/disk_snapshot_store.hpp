#pragma once

#include <arrow/buffer.h>

#include <filesystem>
#include <memory>
#include <string>

#include "internal/storage/snapshot_store.hpp"

namespace checkpoint::storage {

/*
  Snapshot store on a local directory.

  Layout mirrors the key: <root>/<strategy>/<worker>/<generation>.snap
  Writes go through <final>.tmp and a hard link, so readers never observe
  a partial object and an existing generation is never replaced.
*/
class DiskSnapshotStore final : public SnapshotStore {
 public:
  explicit DiskSnapshotStore(std::filesystem::path root, bool fsync = true);

  void Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) override;

  std::shared_ptr<arrow::Buffer> Get(const std::string& key) override;

  std::vector<std::string> List(const std::string& prefix) override;

  void Remove(const std::string& key) override;

  StoreKind Kind() const override {
    return StoreKind::kDisk;
  }

 private:
  std::filesystem::path KeyPath(const std::string& key) const;

  std::filesystem::path root_;
  bool                  fsync_;
};

} // namespace checkpoint::storage
