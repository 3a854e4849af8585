#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace carelog::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertPendingReport(Transaction&, const model::PendingReportRecord&) override;
  std::optional<model::PendingReportRecord> GetPendingReport(Transaction&, const std::string&) override;
  std::vector<model::PendingReportRecord> ListPendingReports(Transaction&) override;
  Result DeletePendingReport(Transaction&, const std::string&) override;

private:
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

}
