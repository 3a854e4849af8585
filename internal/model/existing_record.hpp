#pragma once

#include <optional>
#include <string>

#include "internal/model/event_kind.hpp"
#include "internal/util/time.hpp"

namespace carelog::model {

// Read-only view of a record already in a domain store, used for duplicate
// detection. reference is "<table>/<id>".
struct ExistingRecord {
  std::string                    reference;
  EventKind                      kind = EventKind::kOther;
  util::TimePoint                start_time{};
  std::optional<util::TimePoint> end_time;
  std::optional<double>          quantity;
};

}  // namespace carelog::model
