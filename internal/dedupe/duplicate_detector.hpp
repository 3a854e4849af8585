#pragma once

#include <chrono>
#include <optional>
#include <vector>

#include "internal/model/candidate_event.hpp"
#include "internal/model/existing_record.hpp"

namespace carelog::dedupe {

struct DetectionWindows {
  // compared window for a sleep that has no end on either side; never written back
  std::chrono::minutes sleep_default_duration{60};
  // +/- tolerance for point-in-time kinds, inclusive
  std::chrono::minutes instant_tolerance{15};
};

/*
  Flags candidates that already exist in the user's history.

  sleep:                  half-open interval overlap; touching ends do not count
  feed/diaper/activity:   |start - history start| <= instant_tolerance
  other:                  never matched

  When several records match, the one with the closest start wins (first in
  history order on ties). Annotation is recomputed from scratch on every call,
  so running it twice yields the same result, and a candidate whose match was
  edited away loses its flag.

  Pure; no shared mutable state.
*/
class DuplicateDetector {
 public:
  DuplicateDetector() = default;
  explicit DuplicateDetector(DetectionWindows windows);

  std::vector<model::CandidateEvent> Detect(std::vector<model::CandidateEvent>      candidates,
                                            const std::vector<model::ExistingRecord>& history) const;

  void Annotate(model::CandidateEvent& candidate, const std::vector<model::ExistingRecord>& history) const;

  const DetectionWindows& Windows() const {
    return windows_;
  }

 private:
  const model::ExistingRecord* FindSleepOverlap(const model::CandidateEvent&              candidate,
                                                const std::vector<model::ExistingRecord>& history) const;
  const model::ExistingRecord* FindInstantMatch(const model::CandidateEvent&              candidate,
                                                const std::vector<model::ExistingRecord>& history) const;

  DetectionWindows windows_;
};

} // namespace carelog::dedupe
