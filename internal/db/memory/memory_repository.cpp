#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace carelog::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertPendingReport(Transaction& t, const model::PendingReportRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.pending_reports.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "pending report " + r.id);
  s.pending_reports[r.id] = r;
  return Result::Ok();
}

std::optional<model::PendingReportRecord> MemoryRepository::GetPendingReport(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.pending_reports.find(id);
  if (it == s.pending_reports.end()) return std::nullopt;
  return it->second;
}

std::vector<model::PendingReportRecord> MemoryRepository::ListPendingReports(Transaction& t) {
  const auto&                             s = TX(t).View();
  std::vector<model::PendingReportRecord> records;
  records.reserve(s.pending_reports.size());
  for (const auto& [_, record] : s.pending_reports) {
    records.push_back(record);
  }

  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
    return a.id > b.id;
  });
  return records;
}

Result MemoryRepository::DeletePendingReport(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  if (s.pending_reports.erase(id) == 0) return Result::Err(ErrorCode::NotFound, "pending report " + id);
  return Result::Ok();
}

} // namespace carelog::db::memory
