#include "sqlite_schema.hpp"

namespace carelog::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  db.Exec(R"sql(
CREATE TABLE IF NOT EXISTS pending_report(
  id TEXT PRIMARY KEY,
  created_at_ms INTEGER NOT NULL,
  source_ref TEXT NOT NULL,
  format TEXT NOT NULL,
  source_name TEXT NOT NULL,
  reference_date TEXT NOT NULL,
  size_bytes INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS pending_report_created_idx ON pending_report(created_at_ms DESC, id DESC);

CREATE TABLE IF NOT EXISTS sleep_log(
  id TEXT PRIMARY KEY,
  start_ms INTEGER NOT NULL,
  end_ms INTEGER NOT NULL,
  quality TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS sleep_log_start_idx ON sleep_log(start_ms);

CREATE TABLE IF NOT EXISTS bottle_feed_log(
  id TEXT PRIMARY KEY,
  time_ms INTEGER NOT NULL,
  amount REAL NOT NULL,
  unit TEXT NOT NULL,
  feed_type TEXT NOT NULL,
  notes TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS bottle_feed_log_time_idx ON bottle_feed_log(time_ms);

CREATE TABLE IF NOT EXISTS nursing_log(
  id TEXT PRIMARY KEY,
  time_ms INTEGER NOT NULL,
  duration_minutes REAL NOT NULL,
  side TEXT NOT NULL,
  notes TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS nursing_log_time_idx ON nursing_log(time_ms);

CREATE TABLE IF NOT EXISTS diaper_log(
  id TEXT PRIMARY KEY,
  time_ms INTEGER NOT NULL,
  type TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS diaper_log_time_idx ON diaper_log(time_ms);

CREATE TABLE IF NOT EXISTS activity_log(
  id TEXT PRIMARY KEY,
  time_ms INTEGER NOT NULL,
  activity_type TEXT NOT NULL,
  description TEXT NOT NULL,
  notes TEXT
);
CREATE INDEX IF NOT EXISTS activity_log_time_idx ON activity_log(time_ms);
)sql");
}

} // namespace carelog::db::sqlite
