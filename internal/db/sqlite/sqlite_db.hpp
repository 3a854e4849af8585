#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace carelog::db::sqlite {

/*
  Thin RAII wrapper around one sqlite3* connection.

  The connection is shared by the pending-report repository and the domain
  stores; TransactionMutex() serializes their transactions on it.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (pragmas, schema, transaction control)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

 private:
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace carelog::db::sqlite
