#pragma once

#include <optional>
#include <string>

#include "internal/model/event_kind.hpp"
#include "internal/model/review_state.hpp"
#include "internal/util/time.hpp"

namespace carelog::model {

/*
  One event proposed by extraction and held for review.

  Invariants kept by every producer and by ReviewSession edits:
    - end_time is only present for sleep and is strictly after start_time
    - wet / dirty are only set for diapers
    - duplicate_reason is present iff duplicate_flag
*/
struct CandidateEvent {
  std::string                    id;
  EventKind                      kind = EventKind::kOther;
  util::TimePoint                start_time{};
  std::optional<util::TimePoint> end_time;
  std::optional<std::string>     quantity_text;
  std::string                    details;
  bool                           wet   = false;
  bool                           dirty = false;

  ReviewState                review_state   = ReviewState::kDetected;
  bool                       duplicate_flag = false;
  std::optional<std::string> duplicate_reason;
};

inline bool HasValidInterval(const CandidateEvent& event) {
  return !event.end_time || *event.end_time > event.start_time;
}

// A sleep without an end time cannot be confirmed or committed.
inline bool IsComplete(const CandidateEvent& event) {
  return event.kind != EventKind::kSleep || event.end_time.has_value();
}

}  // namespace carelog::model
