#include "storage_factory.hpp"

#include <filesystem>

#include "disk/disk_blob_store.hpp"
#include "ram/ram_blob_store.hpp"

namespace carelog::storage {

BlobStorePtr StorageFactory::Build(const carelog::runtime::config::StorageConfig& cfg, bool in_memory) {
  if (in_memory) {
    return std::make_shared<RamBlobStore>();
  }

  std::filesystem::path root =
      cfg.disk().root_path().empty() ? std::filesystem::path{"./carelog-data/pending"} : std::filesystem::path{cfg.disk().root_path()};
  return std::make_shared<DiskBlobStore>(std::move(root));
}

} // namespace carelog::storage
