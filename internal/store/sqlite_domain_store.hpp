#pragma once

#include <memory>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/store/domain_store.hpp"

namespace carelog::store {

/*
  Domain store over the shared SQLite connection, one table per record type
  (see db/sqlite/sqlite_schema.cpp). The feed store reads and writes both
  bottle_feed_log and nursing_log.
*/
class SqliteDomainStore final : public DomainStore {
 public:
  SqliteDomainStore(std::shared_ptr<db::sqlite::SqliteDB> db, model::EventKind kind);

  model::EventKind Kind() const override {
    return kind_;
  }

  util::StatusOr<std::vector<model::ExistingRecord>> Query(const model::TimeRange& range) override;

  util::StatusOr<RecordReference> Append(const DomainRecord& record) override;

 private:
  void QueryTable(const char* sql, const model::TimeRange& range, model::EventKind kind, const char* table,
                  std::vector<model::ExistingRecord>& out);
  void Insert(const RecordReference& reference, const DomainRecord& record);

  std::shared_ptr<db::sqlite::SqliteDB> db_;
  model::EventKind                      kind_;
};

DomainStoreMap MakeSqliteDomainStores(const std::shared_ptr<db::sqlite::SqliteDB>& db);

} // namespace carelog::store
