#pragma once

#include <mutex>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace carelog::db::memory {

class MemoryTransaction;

/*
  In-process repository. Same contract as SQLite minus durability; used by
  tests and the in-memory configuration.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertPendingReport(Transaction&, const model::PendingReportRecord&) override;
  std::optional<model::PendingReportRecord> GetPendingReport(Transaction&, const std::string&) override;
  std::vector<model::PendingReportRecord> ListPendingReports(Transaction&) override;
  Result DeletePendingReport(Transaction&, const std::string&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::PendingReportRecord> pending_reports;
  };

  // held by an open transaction for its lifetime
  std::mutex writer_mutex_;
  // guards committed_
  std::mutex mutex_;
  State      committed_;
};

}
