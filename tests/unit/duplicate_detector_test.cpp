#include "internal/dedupe/duplicate_detector.hpp"
#include "internal/dedupe/history_window.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

using namespace std::chrono_literals;

using carelog::dedupe::DetectionWindows;
using carelog::dedupe::DuplicateDetector;
using carelog::dedupe::HistoryRangeFor;
using carelog::dedupe::HistoryWindow;
using carelog::model::CandidateEvent;
using carelog::model::EventKind;
using carelog::model::ExistingRecord;
using carelog::util::Day;
using carelog::util::TimePoint;

const Day kDay{std::chrono::year{2026} / 3 / 14};

TimePoint T(std::chrono::minutes since_midnight) {
  return carelog::util::At(kDay, since_midnight);
}

CandidateEvent Candidate(EventKind kind, TimePoint start, std::optional<TimePoint> end = std::nullopt) {
  CandidateEvent candidate;
  candidate.id         = "c-" + std::to_string(start.time_since_epoch().count());
  candidate.kind       = kind;
  candidate.start_time = start;
  candidate.end_time   = end;
  return candidate;
}

ExistingRecord Record(EventKind kind, TimePoint start, std::optional<TimePoint> end = std::nullopt, std::string ref = "r/1") {
  ExistingRecord record;
  record.reference  = std::move(ref);
  record.kind       = kind;
  record.start_time = start;
  record.end_time   = end;
  return record;
}

void TestIdenticalSleepIntervalIsFlagged() {
  DuplicateDetector detector;
  auto              candidate = Candidate(EventKind::kSleep, T(19h), T(20h + 30min));

  detector.Annotate(candidate, {Record(EventKind::kSleep, T(19h), T(20h + 30min))});
  assert(candidate.duplicate_flag);
  assert(candidate.duplicate_reason == "Overlaps existing sleep log from 19:00 to 20:30");
}

void TestTouchingSleepIsNotFlagged() {
  DuplicateDetector detector;
  auto              candidate = Candidate(EventKind::kSleep, T(20h + 30min), T(21h));

  detector.Annotate(candidate, {Record(EventKind::kSleep, T(19h), T(20h + 30min))});
  assert(!candidate.duplicate_flag);
  assert(!candidate.duplicate_reason.has_value());
}

void TestOpenEndedSleepUsesDefaultWindow() {
  DuplicateDetector detector;

  // no end on either side: [13:00, 14:00) vs [13:45, 14:45)
  auto overlapping = Candidate(EventKind::kSleep, T(13h + 45min));
  detector.Annotate(overlapping, {Record(EventKind::kSleep, T(13h))});
  assert(overlapping.duplicate_flag);
  assert(overlapping.duplicate_reason == "Overlaps existing sleep log starting at 13:00");

  auto after = Candidate(EventKind::kSleep, T(14h));
  detector.Annotate(after, {Record(EventKind::kSleep, T(13h))});
  assert(!after.duplicate_flag);
  assert(!after.end_time.has_value());
}

void TestInstantToleranceIsInclusive() {
  DuplicateDetector detector;
  std::vector<ExistingRecord> history = {Record(EventKind::kFeed, T(9h))};

  auto at_edge = Candidate(EventKind::kFeed, T(9h + 15min));
  detector.Annotate(at_edge, history);
  assert(at_edge.duplicate_flag);
  assert(at_edge.duplicate_reason == "Within 15 minutes of existing feed log at 09:00");

  auto outside = Candidate(EventKind::kFeed, T(9h + 16min));
  detector.Annotate(outside, history);
  assert(!outside.duplicate_flag);

  auto other_kind = Candidate(EventKind::kDiaper, T(9h));
  detector.Annotate(other_kind, history);
  assert(!other_kind.duplicate_flag);
}

void TestOtherIsNeverMatched() {
  DuplicateDetector detector;
  auto              candidate = Candidate(EventKind::kOther, T(11h));
  detector.Annotate(candidate, {Record(EventKind::kOther, T(11h)), Record(EventKind::kActivity, T(11h))});
  assert(!candidate.duplicate_flag);
}

void TestClosestMatchWins() {
  DuplicateDetector detector;
  auto              candidate = Candidate(EventKind::kDiaper, T(10h));

  detector.Annotate(candidate, {Record(EventKind::kDiaper, T(9h + 50min), std::nullopt, "diaper/1"),
                                Record(EventKind::kDiaper, T(10h + 5min), std::nullopt, "diaper/2")});
  assert(candidate.duplicate_reason == "Within 15 minutes of existing diaper log at 10:05");
}

void TestDetectionIsIdempotentAndClearsStaleFlags() {
  DuplicateDetector detector(DetectionWindows{60min, 15min});
  std::vector<ExistingRecord> history = {Record(EventKind::kFeed, T(12h)), Record(EventKind::kSleep, T(13h), T(14h))};

  std::vector<CandidateEvent> batch = {Candidate(EventKind::kFeed, T(12h + 10min)),
                                       Candidate(EventKind::kSleep, T(15h), T(16h)),
                                       Candidate(EventKind::kSleep, T(13h + 30min), T(15h))};

  auto once  = detector.Detect(batch, history);
  auto twice = detector.Detect(once, history);
  assert(once.size() == twice.size());
  for (std::size_t i = 0; i < once.size(); ++i) {
    assert(once[i].duplicate_flag == twice[i].duplicate_flag);
    assert(once[i].duplicate_reason == twice[i].duplicate_reason);
  }
  assert(once[0].duplicate_flag && !once[1].duplicate_flag && once[2].duplicate_flag);

  // edited away from its match
  twice[0].start_time = T(18h);
  detector.Annotate(twice[0], history);
  assert(!twice[0].duplicate_flag);
  assert(!twice[0].duplicate_reason.has_value());
}

void TestHistoryRangeCoversBatchWithPadding() {
  HistoryWindow window;
  assert(!HistoryRangeFor({}, window).has_value());

  std::vector<CandidateEvent> batch = {Candidate(EventKind::kFeed, T(9h)), Candidate(EventKind::kSleep, T(19h), T(20h + 30min))};
  auto range = HistoryRangeFor(batch, window);
  assert(range.has_value());
  assert(range->from == T(9h) - 24h);
  assert(range->to == T(20h + 30min) + 24h);
  assert(range->Contains(T(9h)));
}

void TestHistoryRangeIsClampedToMaxSpan() {
  HistoryWindow window;
  window.padding  = 24h;
  window.max_span = std::chrono::days(2);

  std::vector<CandidateEvent> batch = {Candidate(EventKind::kFeed, T(9h) - std::chrono::days(10)), Candidate(EventKind::kFeed, T(9h))};
  auto range = HistoryRangeFor(batch, window);
  assert(range.has_value());
  assert(range->to == T(9h) + 24h);
  assert(range->from == range->to - std::chrono::days(2));
}

} // namespace

int main() {
  TestIdenticalSleepIntervalIsFlagged();
  TestTouchingSleepIsNotFlagged();
  TestOpenEndedSleepUsesDefaultWindow();
  TestInstantToleranceIsInclusive();
  TestOtherIsNeverMatched();
  TestClosestMatchWins();
  TestDetectionIsIdempotentAndClearsStaleFlags();
  TestHistoryRangeCoversBatchWithPadding();
  TestHistoryRangeIsClampedToMaxSpan();

  std::cout << "carelog_unit_duplicate_detector: pass\n";
  return 0;
}
