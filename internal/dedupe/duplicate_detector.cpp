#include "duplicate_detector.hpp"

#include <string>

#include "internal/util/time.hpp"

namespace carelog::dedupe {
namespace {

using model::CandidateEvent;
using model::EventKind;
using model::ExistingRecord;

std::chrono::milliseconds Distance(util::TimePoint a, util::TimePoint b) {
  auto d = std::chrono::duration_cast<std::chrono::milliseconds>(a - b);
  return d < std::chrono::milliseconds::zero() ? -d : d;
}

std::string SleepReason(const ExistingRecord& record) {
  if (record.end_time) {
    return "Overlaps existing sleep log from " + util::FormatClockTime(record.start_time) + " to " +
           util::FormatClockTime(*record.end_time);
  }
  return "Overlaps existing sleep log starting at " + util::FormatClockTime(record.start_time);
}

std::string InstantReason(const ExistingRecord& record, std::chrono::minutes tolerance) {
  return "Within " + std::to_string(tolerance.count()) + " minutes of existing " +
         std::string(model::ToString(record.kind)) + " log at " + util::FormatClockTime(record.start_time);
}

} // namespace

DuplicateDetector::DuplicateDetector(DetectionWindows windows) : windows_(windows) {
}

std::vector<CandidateEvent> DuplicateDetector::Detect(std::vector<CandidateEvent>        candidates,
                                                      const std::vector<ExistingRecord>& history) const {
  for (auto& candidate : candidates) {
    Annotate(candidate, history);
  }
  return candidates;
}

void DuplicateDetector::Annotate(CandidateEvent& candidate, const std::vector<ExistingRecord>& history) const {
  candidate.duplicate_flag = false;
  candidate.duplicate_reason.reset();

  switch (candidate.kind) {
    case EventKind::kSleep:
      if (const auto* match = FindSleepOverlap(candidate, history)) {
        candidate.duplicate_flag   = true;
        candidate.duplicate_reason = SleepReason(*match);
      }
      return;

    case EventKind::kFeed:
    case EventKind::kDiaper:
    case EventKind::kActivity:
      if (const auto* match = FindInstantMatch(candidate, history)) {
        candidate.duplicate_flag   = true;
        candidate.duplicate_reason = InstantReason(*match, windows_.instant_tolerance);
      }
      return;

    case EventKind::kOther:
      return;
  }
}

const ExistingRecord* DuplicateDetector::FindSleepOverlap(const CandidateEvent&              candidate,
                                                          const std::vector<ExistingRecord>& history) const {
  const auto start = candidate.start_time;
  const auto end   = candidate.end_time.value_or(start + windows_.sleep_default_duration);

  const ExistingRecord*     best = nullptr;
  std::chrono::milliseconds best_distance{};

  for (const auto& record : history) {
    if (record.kind != EventKind::kSleep) continue;

    const auto record_end = record.end_time.value_or(record.start_time + windows_.sleep_default_duration);
    const bool overlaps   = start < record_end && record.start_time < end;
    if (!overlaps) continue;

    const auto distance = Distance(record.start_time, start);
    if (!best || distance < best_distance) {
      best          = &record;
      best_distance = distance;
    }
  }
  return best;
}

const ExistingRecord* DuplicateDetector::FindInstantMatch(const CandidateEvent&              candidate,
                                                          const std::vector<ExistingRecord>& history) const {
  const ExistingRecord*     best = nullptr;
  std::chrono::milliseconds best_distance{};

  for (const auto& record : history) {
    if (record.kind != candidate.kind) continue;

    const auto distance = Distance(record.start_time, candidate.start_time);
    if (distance > windows_.instant_tolerance) continue;

    if (!best || distance < best_distance) {
      best          = &record;
      best_distance = distance;
    }
  }
  return best;
}

} // namespace carelog::dedupe
