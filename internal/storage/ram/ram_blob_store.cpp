#include "ram_blob_store.hpp"

#include <algorithm>

#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace carelog::storage {

std::shared_ptr<arrow::Buffer> RamBlobStore::Read(const std::string& id) {
  std::shared_lock lock(mutex_);

  auto it = buffers_.find(id);
  if (it == buffers_.end()) throw util::NotFound("blob not found: " + id);

  return it->second;
}

void RamBlobStore::Write(const std::string& id, const std::shared_ptr<arrow::Buffer>& buffer, bool /*fsync unused*/) {
  common::ValidateBlobId(id);

  std::unique_lock lock(mutex_);
  buffers_[id] = buffer;
}

bool RamBlobStore::Exists(const std::string& id) {
  std::shared_lock lock(mutex_);
  return buffers_.contains(id);
}

std::vector<std::string> RamBlobStore::List(const std::string& prefix) {
  std::vector<std::string> ids;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [id, _] : buffers_) {
      if (id.compare(0, prefix.size(), prefix) == 0) ids.push_back(id);
    }
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

void RamBlobStore::Remove(const std::string& id) {
  std::unique_lock lock(mutex_);
  buffers_.erase(id);
}

} // namespace carelog::storage
