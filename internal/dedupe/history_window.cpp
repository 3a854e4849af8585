#include "history_window.hpp"

#include <algorithm>

namespace carelog::dedupe {

std::optional<model::TimeRange> HistoryRangeFor(const std::vector<model::CandidateEvent>& candidates,
                                                const HistoryWindow&                      window) {
  if (candidates.empty()) return std::nullopt;

  auto earliest = candidates.front().start_time;
  auto latest   = candidates.front().end_time.value_or(candidates.front().start_time);
  for (const auto& candidate : candidates) {
    earliest = std::min(earliest, candidate.start_time);
    latest   = std::max(latest, candidate.end_time.value_or(candidate.start_time));
  }

  model::TimeRange range{earliest - window.padding, latest + window.padding};
  range.from = std::max(range.from, range.to - window.max_span);
  return range;
}

} // namespace carelog::dedupe
