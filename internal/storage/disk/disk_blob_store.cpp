#include "disk_blob_store.hpp"

#include <arrow/io/file.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace carelog::storage {

using namespace carelog::storage::common;

namespace {

[[noreturn]] void ThrowErrno(const std::string& what, const std::filesystem::path& path) {
  throw util::StorageError(what + " " + path.string() + ": " + std::strerror(errno));
}

bool EndsWith(const std::string& text, const std::string& suffix) {
  return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

DiskBlobStore::DiskBlobStore(std::filesystem::path root) : root_(std::move(root)) {
  std::error_code ec;
  std::filesystem::create_directories(root_, ec);
  if (ec) {
    throw util::StorageError("create blob root " + root_.string() + ": " + ec.message());
  }
}

std::shared_ptr<arrow::Buffer> DiskBlobStore::Read(const std::string& id) {
  auto path = BlobPath(root_, id);
  if (!std::filesystem::exists(path)) {
    throw util::NotFound("blob not found: " + id);
  }

  auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  auto buffer = ReadAll(file);
  Unwrap(file->Close());
  return buffer;
}

/*
  Atomic write:
      write tmp -> fsync -> close -> rename -> fsync dir
*/
void DiskBlobStore::Write(const std::string& id, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) {
  auto final_path = BlobPath(root_, id);
  auto tmp_path   = std::filesystem::path(final_path.string() + kTmpSuffix);

  {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path.string()));
    Unwrap(out->Write(buffer->data(), buffer->size()));
    Unwrap(out->Flush());

    if (fsync && ::fsync(out->file_descriptor()) != 0) {
      ThrowErrno("fsync", tmp_path);
    }

    Unwrap(out->Close());
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, final_path, ec);
  if (ec) {
    std::filesystem::remove(tmp_path, ec);
    throw util::StorageError("rename " + tmp_path.string() + " -> " + final_path.string() + " failed");
  }

  if (fsync) SyncDirectory();
}

bool DiskBlobStore::Exists(const std::string& id) {
  return std::filesystem::exists(BlobPath(root_, id));
}

std::vector<std::string> DiskBlobStore::List(const std::string& prefix) {
  std::vector<std::string> ids;

  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator(root_, ec)) {
    if (!entry.is_regular_file()) continue;

    auto name = entry.path().filename().string();
    if (!EndsWith(name, kBlobSuffix)) continue;

    name.resize(name.size() - std::strlen(kBlobSuffix));
    if (name.compare(0, prefix.size(), prefix) == 0) ids.push_back(std::move(name));
  }
  if (ec) {
    throw util::StorageError("list " + root_.string() + ": " + ec.message());
  }

  std::sort(ids.begin(), ids.end());
  return ids;
}

void DiskBlobStore::Remove(const std::string& id) {
  std::error_code ec;
  std::filesystem::remove(BlobPath(root_, id), ec);
  if (ec) {
    throw util::StorageError("remove blob " + id + ": " + ec.message());
  }
}

uint64_t DiskBlobStore::Size(const std::string& id) {
  std::error_code ec;
  auto size = std::filesystem::file_size(BlobPath(root_, id), ec);
  if (ec) {
    throw util::NotFound("blob not found: " + id);
  }
  return static_cast<uint64_t>(size);
}

void DiskBlobStore::SyncDirectory() const {
  int fd = ::open(root_.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0) ThrowErrno("open dir", root_);

  const int rc = ::fsync(fd);
  ::close(fd);
  if (rc != 0) ThrowErrno("fsync dir", root_);
}

} // namespace carelog::storage
