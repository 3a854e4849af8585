#pragma once

#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "internal/store/domain_store.hpp"

namespace carelog::store {

class MemoryDomainStore final : public DomainStore {
 public:
  explicit MemoryDomainStore(model::EventKind kind);

  model::EventKind Kind() const override {
    return kind_;
  }

  util::StatusOr<std::vector<model::ExistingRecord>> Query(const model::TimeRange& range) override;

  util::StatusOr<RecordReference> Append(const DomainRecord& record) override;

  // (reference, record) in append order
  std::vector<std::pair<RecordReference, DomainRecord>> Records() const;

 private:
  model::EventKind kind_;

  mutable std::mutex                                    mutex_;
  std::vector<std::pair<RecordReference, DomainRecord>> records_;
};

// One MemoryDomainStore per kind except other (routed to activity).
DomainStoreMap MakeMemoryDomainStores();

// Shared by the memory and SQLite stores.
model::ExistingRecord ToExistingRecord(const RecordReference& reference, const DomainRecord& record);
util::TimePoint       StartOf(const DomainRecord& record);

} // namespace carelog::store
