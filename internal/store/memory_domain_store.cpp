#include "memory_domain_store.hpp"

#include <type_traits>
#include <variant>

#include "internal/util/uuid.hpp"

namespace carelog::store {

using util::Status;
using util::StatusCode;

util::TimePoint StartOf(const DomainRecord& record) {
  return std::visit(
      [](const auto& r) -> util::TimePoint {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, SleepRecord>) {
          return r.start_time;
        } else {
          return r.time;
        }
      },
      record);
}

model::ExistingRecord ToExistingRecord(const RecordReference& reference, const DomainRecord& record) {
  model::ExistingRecord existing;
  existing.reference  = reference.ToString();
  existing.kind       = KindOf(record);
  existing.start_time = StartOf(record);

  if (const auto* sleep = std::get_if<SleepRecord>(&record)) {
    existing.end_time = sleep->end_time;
  } else if (const auto* bottle = std::get_if<BottleFeedRecord>(&record)) {
    existing.quantity = bottle->amount;
  } else if (const auto* nursing = std::get_if<NursingRecord>(&record)) {
    existing.quantity = nursing->duration_minutes;
  }
  return existing;
}

MemoryDomainStore::MemoryDomainStore(model::EventKind kind) : kind_(kind) {
}

util::StatusOr<std::vector<model::ExistingRecord>> MemoryDomainStore::Query(const model::TimeRange& range) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<model::ExistingRecord> out;
  for (const auto& [reference, record] : records_) {
    if (range.Contains(StartOf(record))) out.push_back(ToExistingRecord(reference, record));
  }
  return out;
}

util::StatusOr<RecordReference> MemoryDomainStore::Append(const DomainRecord& record) {
  if (KindOf(record) != kind_) {
    return Status::Err(StatusCode::kInvalidArgument, std::string(TableOf(record)) + " record does not belong in the " +
                                                         std::string(model::ToString(kind_)) + " store");
  }

  RecordReference reference{std::string(TableOf(record)), util::NewId()};

  std::lock_guard<std::mutex> lock(mutex_);
  records_.emplace_back(reference, record);
  return reference;
}

std::vector<std::pair<RecordReference, DomainRecord>> MemoryDomainStore::Records() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_;
}

DomainStoreMap MakeMemoryDomainStores() {
  DomainStoreMap stores;
  for (auto kind : {model::EventKind::kSleep, model::EventKind::kFeed, model::EventKind::kDiaper, model::EventKind::kActivity}) {
    stores.emplace(kind, std::make_shared<MemoryDomainStore>(kind));
  }
  return stores;
}

} // namespace carelog::store
