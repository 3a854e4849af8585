#pragma once

#include <cstdint>
#include <string>

namespace carelog::db::model {

/*
  Persistent pending_report row.

  source_ref is the blob store key of the report bytes. format is "image" or
  "text". reference_date is YYYY-MM-DD.
*/

struct PendingReportRecord {
  std::string id;

  int64_t created_at_ms = 0;

  std::string source_ref;
  std::string format;
  std::string source_name;
  std::string reference_date;

  uint64_t size_bytes = 0;
};

}
