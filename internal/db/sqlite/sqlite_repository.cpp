#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/util/errors.hpp"

namespace carelog::db::sqlite {

using carelog::db::ErrorCode;
using carelog::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

static sqlite3_stmt* PrepareOrThrow(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        throw util::StorageError(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    return st;
}

static model::PendingReportRecord ReadRow(sqlite3_stmt* st) {
    model::PendingReportRecord r;
    r.id             = ColText(st, 0);
    r.created_at_ms  = ColI64(st, 1);
    r.source_ref     = ColText(st, 2);
    r.format         = ColText(st, 3);
    r.source_name    = ColText(st, 4);
    r.reference_date = ColText(st, 5);
    r.size_bytes     = static_cast<uint64_t>(ColI64(st, 6));
    return r;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Pending reports
// ------------------------------------------------------------------

Result SqliteRepository::InsertPendingReport(Transaction& t, const model::PendingReportRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO pending_report(id,created_at_ms,source_ref,format,source_name,reference_date,size_bytes) "
        "VALUES(?,?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.id);
    BindI64(st, 2, r.created_at_ms);
    BindText(st, 3, r.source_ref);
    BindText(st, 4, r.format);
    BindText(st, 5, r.source_name);
    BindText(st, 6, r.reference_date);
    BindI64(st, 7, static_cast<int64_t>(r.size_bytes));

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (result.code == ErrorCode::ConstraintViolation)
        return Result::Err(ErrorCode::AlreadyExists, result.message);
    return result;
}

std::optional<model::PendingReportRecord>
SqliteRepository::GetPendingReport(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT id,created_at_ms,source_ref,format,source_name,reference_date,size_bytes "
        "FROM pending_report WHERE id=?;";

    sqlite3_stmt* st = PrepareOrThrow(db, sql);
    BindText(st, 1, id);

    int rc = sqlite3_step(st);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(st);
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        std::string msg = sqlite3_errmsg(db);
        sqlite3_finalize(st);
        throw util::StorageError("read pending_report " + id + ": " + msg);
    }

    auto r = ReadRow(st);
    sqlite3_finalize(st);
    return r;
}

std::vector<model::PendingReportRecord> SqliteRepository::ListPendingReports(Transaction& t) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT id,created_at_ms,source_ref,format,source_name,reference_date,size_bytes "
        "FROM pending_report ORDER BY created_at_ms DESC, id DESC;";

    sqlite3_stmt* st = PrepareOrThrow(db, sql);

    std::vector<model::PendingReportRecord> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(ReadRow(st));
    }
    if (rc != SQLITE_DONE) {
        std::string msg = sqlite3_errmsg(db);
        sqlite3_finalize(st);
        throw util::StorageError("list pending_report: " + msg);
    }

    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::DeletePendingReport(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    const char* sql = "DELETE FROM pending_report WHERE id=?;";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, id);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "pending report " + id);
    return result;
}

} // namespace carelog::db::sqlite
