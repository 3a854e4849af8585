#pragma once

#include "blob_store.hpp"
#include "config/config.pb.h"

namespace carelog::storage {

/*
  Builds the pending-report blob store from configuration.

      auto blobs = StorageFactory::Build(config.storage(), config.database().has_memory());

  An in-memory database gets a RAM store so the two never disagree about
  what survives a restart.
*/
class StorageFactory {
 public:
  static BlobStorePtr Build(const carelog::runtime::config::StorageConfig& cfg, bool in_memory);
};

} // namespace carelog::storage
