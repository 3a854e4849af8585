#pragma once

#include "sqlite_db.hpp"

namespace carelog::db::sqlite {

/*
  Creates every table this project keeps in SQLite if it does not exist:
  pending_report plus one table per domain record type. Idempotent; called
  on every open.
*/
void BootstrapSchema(SqliteDB& db);

} // namespace carelog::db::sqlite
