#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/storage/snapshot_store.hpp"

namespace checkpoint::storage {

/*
  Builds the snapshot store selected by configuration.

  Core uses this as:

      auto store = StorageFactory::Build(config.storage());
      store->Put(key, buffer);
*/
class StorageFactory {
 public:
  static SnapshotStorePtr Build(const checkpoint::runtime::config::StorageConfig& cfg);
};

} // namespace checkpoint::storage
