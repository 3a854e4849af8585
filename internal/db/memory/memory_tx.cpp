#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace carelog::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), writer_(repo.writer_mutex_) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

void MemoryTransaction::Commit() {
  if (finished_) throw util::InvalidState("transaction already finished");

  std::scoped_lock lock(repo_.mutex_);
  repo_.committed_ = std::move(working_);
  committed_       = true;
  finished_        = true;
}

void MemoryTransaction::Rollback() {
  finished_ = true;
}

} // namespace carelog::db::memory
