#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace carelog::storage::common {

inline constexpr const char* kBlobSuffix = ".bin";
inline constexpr const char* kTmpSuffix  = ".tmp";

inline void ValidateBlobId(const std::string& blob_id) {
  if (blob_id.empty()) {
    throw std::invalid_argument("blob id must not be empty");
  }
  for (char c : blob_id) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument("blob id contains invalid character");
    }
  }
  if (blob_id == "." || blob_id == "..") {
    throw std::invalid_argument("blob id must not be a relative path component");
  }
}

inline std::filesystem::path BlobPath(const std::filesystem::path& root, const std::string& blob_id) {
  ValidateBlobId(blob_id);
  return root / (blob_id + kBlobSuffix);
}

} // namespace carelog::storage::common
