#pragma once

#include "internal/util/time.hpp"

namespace carelog::model {

// Half-open [from, to).
struct TimeRange {
  util::TimePoint from{};
  util::TimePoint to{};

  bool Contains(util::TimePoint tp) const {
    return tp >= from && tp < to;
  }
};

}  // namespace carelog::model
