#pragma once

#include <memory>
#include <unordered_map>
#include <vector>

#include "internal/model/event_kind.hpp"
#include "internal/model/existing_record.hpp"
#include "internal/model/time_range.hpp"
#include "internal/store/domain_record.hpp"
#include "internal/util/status.hpp"

namespace carelog::store {

/*
  System of record for one event kind.

  Query returns every record whose start lies in the range, as read-only
  ExistingRecord views for duplicate detection. Append writes one record
  and returns its reference only once the write is durable. Records of a
  different kind are refused with kInvalidArgument.
*/
class DomainStore {
 public:
  virtual ~DomainStore() = default;

  virtual model::EventKind Kind() const = 0;

  virtual util::StatusOr<std::vector<model::ExistingRecord>> Query(const model::TimeRange& range) = 0;

  virtual util::StatusOr<RecordReference> Append(const DomainRecord& record) = 0;
};

using DomainStorePtr = std::shared_ptr<DomainStore>;
using DomainStoreMap = std::unordered_map<model::EventKind, DomainStorePtr>;

} // namespace carelog::store
