#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace carelog::storage {

/*
  Durable byte store keyed by opaque id.

  Holds the raw source bytes of pending reports. Every blob is an Arrow
  Buffer; callers never see file paths, so the same queue works over local
  disk, an app sandbox or an object store.

  Ids must not contain path separators. Failures throw util::StorageError,
  a missing id on Read throws util::NotFound.

  Implementations:
    DISK -> Arrow file IO, atomic tmp + rename
    RAM  -> in-memory buffers (tests)
*/
class BlobStore {
 public:
  virtual ~BlobStore() = default;

  // Read the whole blob.
  virtual std::shared_ptr<arrow::Buffer> Read(const std::string& id) = 0;

  /*
    Create or replace a blob. With fsync the bytes and the directory entry
    are on stable storage when this returns.
  */
  virtual void Write(const std::string& id, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) = 0;

  virtual bool Exists(const std::string& id) = 0;

  // Ids starting with prefix, sorted.
  virtual std::vector<std::string> List(const std::string& prefix) = 0;

  // Removing a missing id is not an error.
  virtual void Remove(const std::string& id) = 0;

  virtual uint64_t Size(const std::string& id) {
    return static_cast<uint64_t>(Read(id)->size());
  }
};

using BlobStorePtr = std::shared_ptr<BlobStore>;

} // namespace carelog::storage
