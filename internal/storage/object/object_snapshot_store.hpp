#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>

#include <memory>
#include <string>

#include "internal/storage/snapshot_store.hpp"

namespace checkpoint::storage {

/*
  Snapshot store over an Arrow filesystem (S3 / MinIO or a local URI).

  Characteristics:
    - immutable object writes; Put refuses an existing key
    - atomic per PUT (local filesystems stage <path>.tmp and move it)
    - listing through recursive FileSelector
*/
class ObjectSnapshotStore final : public SnapshotStore {
 public:
  ObjectSnapshotStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path);

  void Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) override;

  std::shared_ptr<arrow::Buffer> Get(const std::string& key) override;

  std::vector<std::string> List(const std::string& prefix) override;

  void Remove(const std::string& key) override;

  StoreKind Kind() const override {
    return StoreKind::kObject;
  }

 private:
  std::string ObjectPath(const std::string& key) const;
  bool        Exists(const std::string& path) const;
  void        DiscardStaged(const std::string& staged);

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_path_;
  bool                                   needs_directories_;
};

} // namespace checkpoint::storage
