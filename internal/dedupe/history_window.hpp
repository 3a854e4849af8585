#pragma once

#include <chrono>
#include <optional>
#include <vector>

#include "internal/model/candidate_event.hpp"
#include "internal/model/time_range.hpp"

namespace carelog::dedupe {

struct HistoryWindow {
  std::chrono::hours padding{24};
  std::chrono::days  max_span{14};
};

/*
  Range of history to load for a candidate batch:

    [min start - padding, max(end or start) + padding)

  clamped so it never reaches further back than max_span before its upper
  bound. Empty batch -> nullopt (nothing to compare).
*/
std::optional<model::TimeRange> HistoryRangeFor(const std::vector<model::CandidateEvent>& candidates,
                                                const HistoryWindow&                      window);

} // namespace carelog::dedupe
