#pragma once

#include <shared_mutex>
#include <unordered_map>

#include "internal/storage/blob_store.hpp"

namespace carelog::storage {

/*
  In-memory blob store. Contents die with the process; used in tests and for
  the in-memory configuration.
*/
class RamBlobStore final : public BlobStore {
 public:
  std::shared_ptr<arrow::Buffer> Read(const std::string& id) override;

  void Write(const std::string& id, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) override;

  bool Exists(const std::string& id) override;

  std::vector<std::string> List(const std::string& prefix) override;

  void Remove(const std::string& id) override;

 private:
  std::shared_mutex                                               mutex_;
  std::unordered_map<std::string, std::shared_ptr<arrow::Buffer>> buffers_;
};

} // namespace carelog::storage
