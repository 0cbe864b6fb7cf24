#include "internal/storage/snapshot_store_factory.hpp"

#include <filesystem>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/disk/disk_snapshot_store.hpp"
#include "internal/storage/object/object_snapshot_store.hpp"
#include "internal/storage/ram/ram_snapshot_store.hpp"

namespace checkpoint::storage {

SnapshotStorePtr StorageFactory::Build(const checkpoint::runtime::config::StorageConfig& cfg) {
  using checkpoint::runtime::config::StorageConfig;

  switch (cfg.backend_case()) {
    case StorageConfig::kDisk: {
      std::filesystem::path root =
          cfg.disk().root_path().empty() ? std::filesystem::path{"/tmp/checkpoint-manager"} : std::filesystem::path{cfg.disk().root_path()};
      CHECKPOINT_LOG_INFO("Snapshot store ready", {observability::StringField("backend", "disk"), observability::StringField("root", root.string())});
      return std::make_shared<DiskSnapshotStore>(std::move(root), cfg.disk().fsync());
    }
    case StorageConfig::kObject: {
      auto [object_fs, object_root] = common::OrThrow(common::ResolveFileSystem(cfg.object()), "object storage");
      CHECKPOINT_LOG_INFO("Snapshot store ready",
                          {observability::StringField("backend", "object"), observability::StringField("filesystem", object_fs->type_name()),
                           observability::StringField("root", object_root)});
      return std::make_shared<ObjectSnapshotStore>(std::move(object_fs), std::move(object_root));
    }
    case StorageConfig::kRam:
      return std::make_shared<RamSnapshotStore>();
    case StorageConfig::BACKEND_NOT_SET:
      break;
  }

  CHECKPOINT_LOG_WARN("No snapshot storage configured; snapshots are kept in memory and lost on restart");
  return std::make_shared<RamSnapshotStore>();
}

} // namespace checkpoint::storage
