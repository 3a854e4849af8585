#pragma once

#include <cstdint>
#include <string>

#include "internal/model/source_document.hpp"
#include "internal/util/time.hpp"

namespace carelog::queue {

// A report whose ingestion could not complete. The only pipeline entity that
// survives a restart; candidates are rebuilt from source_reference on retry.
struct PendingReport {
  std::string         id;
  util::TimePoint     created_at{};
  std::string         source_reference;
  model::SourceFormat format = model::SourceFormat::kText;
  std::string         source_name;
  util::Day           reference_day{};
  uint64_t            size_bytes = 0;
};

} // namespace carelog::queue
