#pragma once

#include <arrow/buffer.h>
#include <arrow/io/file.h>
#include <arrow/result.h>

#include <memory>
#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace carelog::storage::common {

/*
  Unwrap Arrow Result<T> / Status or throw util::StorageError.
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw util::StorageError(result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw util::StorageError(status.ToString());
}

inline std::shared_ptr<arrow::Buffer> ReadAll(std::shared_ptr<arrow::io::RandomAccessFile> file) {
  auto size = Unwrap(file->GetSize());
  return Unwrap(file->Read(size));
}

// Owning copy of text bytes.
inline std::shared_ptr<arrow::Buffer> BufferFromString(std::string text) {
  return arrow::Buffer::FromString(std::move(text));
}

inline std::string_view AsStringView(const arrow::Buffer& buffer) {
  return std::string_view(reinterpret_cast<const char*>(buffer.data()), static_cast<std::size_t>(buffer.size()));
}

} // namespace carelog::storage::common
