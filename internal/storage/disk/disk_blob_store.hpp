#pragma once

#include <arrow/buffer.h>

#include <filesystem>

#include "internal/storage/blob_store.hpp"

namespace carelog::storage {

/*
  Durable disk storage using Arrow IO.

  Layout: <root>/<id>.bin

  Properties:
    - atomic replace writes (tmp -> rename)
    - fsync of file and directory on request
    - leftover *.tmp files from a crash are invisible to List()
*/
class DiskBlobStore final : public BlobStore {
 public:
  explicit DiskBlobStore(std::filesystem::path root);

  std::shared_ptr<arrow::Buffer> Read(const std::string& id) override;

  void Write(const std::string& id, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) override;

  bool Exists(const std::string& id) override;

  std::vector<std::string> List(const std::string& prefix) override;

  void Remove(const std::string& id) override;

  uint64_t Size(const std::string& id) override;

  const std::filesystem::path& Root() const {
    return root_;
  }

 private:
  void SyncDirectory() const;

  std::filesystem::path root_;
};

} // namespace carelog::storage
