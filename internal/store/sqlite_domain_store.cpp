#include "sqlite_domain_store.hpp"

#include <sqlite3.h>

#include <variant>

#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace carelog::store {

using util::Status;
using util::StatusCode;

namespace {

// Owns one prepared statement.
class Statement {
 public:
  Statement(db::sqlite::SqliteDB& db, const char* sql) : db_(db.Handle()), st_(db.Prepare(sql)) {
  }
  ~Statement() {
    sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  void BindText(int idx, const std::string& s) {
    sqlite3_bind_text(st_, idx, s.c_str(), -1, SQLITE_TRANSIENT);
  }
  void BindI64(int idx, int64_t v) {
    sqlite3_bind_int64(st_, idx, static_cast<sqlite3_int64>(v));
  }
  void BindDouble(int idx, double v) {
    sqlite3_bind_double(st_, idx, v);
  }
  void BindNull(int idx) {
    sqlite3_bind_null(st_, idx);
  }

  bool Step() {
    int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw util::StorageError(std::string("sqlite step: ") + sqlite3_errmsg(db_));
  }

  std::string ColText(int col) {
    const unsigned char* t = sqlite3_column_text(st_, col);
    return t ? reinterpret_cast<const char*>(t) : "";
  }
  int64_t ColI64(int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st_, col));
  }
  double ColDouble(int col) {
    return sqlite3_column_double(st_, col);
  }
  bool ColNull(int col) {
    return sqlite3_column_type(st_, col) == SQLITE_NULL;
  }

 private:
  sqlite3*      db_;
  sqlite3_stmt* st_;
};

} // namespace

SqliteDomainStore::SqliteDomainStore(std::shared_ptr<db::sqlite::SqliteDB> db, model::EventKind kind)
    : db_(std::move(db)), kind_(kind) {
}

void SqliteDomainStore::QueryTable(const char* sql, const model::TimeRange& range, model::EventKind kind, const char* table,
                                   std::vector<model::ExistingRecord>& out) {
  Statement st(*db_, sql);
  st.BindI64(1, util::ToUnixMillis(range.from));
  st.BindI64(2, util::ToUnixMillis(range.to));

  // columns: id, start, end (nullable), quantity (nullable)
  while (st.Step()) {
    model::ExistingRecord record;
    record.reference  = std::string(table) + "/" + st.ColText(0);
    record.kind       = kind;
    record.start_time = util::FromUnixMillis(st.ColI64(1));
    if (!st.ColNull(2)) record.end_time = util::FromUnixMillis(st.ColI64(2));
    if (!st.ColNull(3)) record.quantity = st.ColDouble(3);
    out.push_back(std::move(record));
  }
}

util::StatusOr<std::vector<model::ExistingRecord>> SqliteDomainStore::Query(const model::TimeRange& range) {
  std::vector<model::ExistingRecord> out;
  try {
    db::sqlite::SqliteTransaction tx(db_);
    switch (kind_) {
      case model::EventKind::kSleep:
        QueryTable("SELECT id,start_ms,end_ms,NULL FROM sleep_log WHERE start_ms>=? AND start_ms<? ORDER BY start_ms;", range,
                   kind_, "sleep_log", out);
        break;
      case model::EventKind::kFeed:
        QueryTable("SELECT id,time_ms,NULL,amount FROM bottle_feed_log WHERE time_ms>=? AND time_ms<? ORDER BY time_ms;", range,
                   kind_, "bottle_feed_log", out);
        QueryTable("SELECT id,time_ms,NULL,duration_minutes FROM nursing_log WHERE time_ms>=? AND time_ms<? ORDER BY time_ms;",
                   range, kind_, "nursing_log", out);
        break;
      case model::EventKind::kDiaper:
        QueryTable("SELECT id,time_ms,NULL,NULL FROM diaper_log WHERE time_ms>=? AND time_ms<? ORDER BY time_ms;", range, kind_,
                   "diaper_log", out);
        break;
      case model::EventKind::kActivity:
      case model::EventKind::kOther:
        QueryTable("SELECT id,time_ms,NULL,NULL FROM activity_log WHERE time_ms>=? AND time_ms<? ORDER BY time_ms;", range,
                   model::EventKind::kActivity, "activity_log", out);
        break;
    }
    tx.Commit();
  } catch (const std::exception& e) {
    return Status::Err(StatusCode::kStorageError, "query " + std::string(model::ToString(kind_)) + " history: " + e.what());
  }
  return out;
}

void SqliteDomainStore::Insert(const RecordReference& reference, const DomainRecord& record) {
  if (const auto* r = std::get_if<SleepRecord>(&record)) {
    Statement st(*db_, "INSERT INTO sleep_log(id,start_ms,end_ms,quality) VALUES(?,?,?,?);");
    st.BindText(1, reference.id);
    st.BindI64(2, util::ToUnixMillis(r->start_time));
    st.BindI64(3, util::ToUnixMillis(r->end_time));
    st.BindText(4, std::string(ToString(r->quality)));
    st.Step();
  } else if (const auto* r = std::get_if<BottleFeedRecord>(&record)) {
    Statement st(*db_, "INSERT INTO bottle_feed_log(id,time_ms,amount,unit,feed_type,notes) VALUES(?,?,?,?,?,?);");
    st.BindText(1, reference.id);
    st.BindI64(2, util::ToUnixMillis(r->time));
    st.BindDouble(3, r->amount);
    st.BindText(4, std::string(model::ToString(r->unit)));
    st.BindText(5, std::string(ToString(r->feed_type)));
    st.BindText(6, r->notes);
    st.Step();
  } else if (const auto* r = std::get_if<NursingRecord>(&record)) {
    Statement st(*db_, "INSERT INTO nursing_log(id,time_ms,duration_minutes,side,notes) VALUES(?,?,?,?,?);");
    st.BindText(1, reference.id);
    st.BindI64(2, util::ToUnixMillis(r->time));
    st.BindDouble(3, r->duration_minutes);
    st.BindText(4, std::string(ToString(r->side)));
    st.BindText(5, r->notes);
    st.Step();
  } else if (const auto* r = std::get_if<DiaperRecord>(&record)) {
    Statement st(*db_, "INSERT INTO diaper_log(id,time_ms,type) VALUES(?,?,?);");
    st.BindText(1, reference.id);
    st.BindI64(2, util::ToUnixMillis(r->time));
    st.BindText(3, std::string(ToString(r->type)));
    st.Step();
  } else if (const auto* r = std::get_if<ActivityRecord>(&record)) {
    Statement st(*db_, "INSERT INTO activity_log(id,time_ms,activity_type,description,notes) VALUES(?,?,?,?,?);");
    st.BindText(1, reference.id);
    st.BindI64(2, util::ToUnixMillis(r->time));
    st.BindText(3, r->activity_type);
    st.BindText(4, r->description);
    if (r->notes) {
      st.BindText(5, *r->notes);
    } else {
      st.BindNull(5);
    }
    st.Step();
  }
}

util::StatusOr<RecordReference> SqliteDomainStore::Append(const DomainRecord& record) {
  const auto record_kind = KindOf(record);
  const auto store_kind  = kind_ == model::EventKind::kOther ? model::EventKind::kActivity : kind_;
  if (record_kind != store_kind) {
    return Status::Err(StatusCode::kInvalidArgument, std::string(TableOf(record)) + " record does not belong in the " +
                                                         std::string(model::ToString(kind_)) + " store");
  }

  RecordReference reference{std::string(TableOf(record)), util::NewId()};
  try {
    db::sqlite::SqliteTransaction tx(db_);
    Insert(reference, record);
    tx.Commit();
  } catch (const std::exception& e) {
    return Status::Err(StatusCode::kStorageError, "append to " + reference.table + ": " + e.what());
  }
  return reference;
}

DomainStoreMap MakeSqliteDomainStores(const std::shared_ptr<db::sqlite::SqliteDB>& db) {
  DomainStoreMap stores;
  for (auto kind : {model::EventKind::kSleep, model::EventKind::kFeed, model::EventKind::kDiaper, model::EventKind::kActivity}) {
    stores.emplace(kind, std::make_shared<SqliteDomainStore>(db, kind));
  }
  return stores;
}

} // namespace carelog::store
