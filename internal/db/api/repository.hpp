#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/pending_report_record.hpp"

namespace carelog::db {

/*
  Metadata index for the offline ingestion queue.

  The repository is the source of truth for which reports are pending; the
  blob store only holds their bytes. Every operation runs inside a
  Transaction, and List always reads the durable table, never a cache.

  Reads that fail in the backend throw util::StorageError; a missing row is
  std::nullopt / ErrorCode::NotFound.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual Result InsertPendingReport(Transaction&, const model::PendingReportRecord&) = 0;

  virtual std::optional<model::PendingReportRecord> GetPendingReport(Transaction&, const std::string& id) = 0;

  // Newest first: created_at_ms DESC, id DESC.
  virtual std::vector<model::PendingReportRecord> ListPendingReports(Transaction&) = 0;

  virtual Result DeletePendingReport(Transaction&, const std::string& id) = 0;
};

} // namespace carelog::db
