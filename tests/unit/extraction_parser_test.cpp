#include "internal/extraction/extraction_parser.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <set>
#include <string>

namespace {

using namespace std::chrono_literals;

using carelog::extraction::KindFromExtractedType;
using carelog::extraction::ParseModelOutput;
using carelog::extraction::StripCodeFences;
using carelog::extraction::ToCandidate;
using carelog::model::EventKind;
using carelog::model::ReviewState;
using carelog::util::StatusCode;

const carelog::util::Day kDay{std::chrono::year{2026} / 3 / 14};

carelog::util::TimePoint T(std::chrono::minutes since_midnight) {
  return carelog::util::At(kDay, since_midnight);
}

void TestCodeFencesAreStripped() {
  assert(StripCodeFences("```json\n[]\n```") == "[]");
  assert(StripCodeFences("Here you go:\n```\n[{\"type\":\"sleep\"}]\n```\nthanks") == "[{\"type\":\"sleep\"}]");
  assert(StripCodeFences("  [1, 2]  \n") == "[1, 2]");
  assert(StripCodeFences("```json\n[]") == "[]");
}

void TestTypeMapping() {
  assert(KindFromExtractedType("sleep") == EventKind::kSleep);
  assert(KindFromExtractedType("Nap") == EventKind::kSleep);
  assert(KindFromExtractedType("bottle") == EventKind::kFeed);
  assert(KindFromExtractedType("nursing") == EventKind::kFeed);
  assert(KindFromExtractedType("solid") == EventKind::kFeed);
  assert(KindFromExtractedType("feed") == EventKind::kFeed);
  assert(KindFromExtractedType("diaper") == EventKind::kDiaper);
  assert(KindFromExtractedType("activity") == EventKind::kActivity);
  assert(KindFromExtractedType("mood") == EventKind::kOther);
  assert(KindFromExtractedType("") == EventKind::kOther);
}

void TestWellFormedArray() {
  auto parsed = ParseModelOutput(R"(```json
[
  {"type": "sleep", "startTime": "19:00", "endTime": "20:30", "quantity": null, "details": "Nap", "isWet": null, "isDirty": null},
  {"type": "bottle", "startTime": "21:15", "endTime": null, "quantity": "4oz", "details": "Formula"},
  {"type": "diaper", "startTime": "22:00", "endTime": null, "quantity": null, "details": "Wet", "isWet": true, "isDirty": false}
]
```)",
                                 kDay);
  assert(parsed.ok());
  assert(parsed->dropped.empty());
  assert(parsed->candidates.size() == 3);

  const auto& sleep = parsed->candidates[0];
  assert(sleep.kind == EventKind::kSleep);
  assert(sleep.start_time == T(19h));
  assert(sleep.end_time == T(20h + 30min));
  assert(sleep.review_state == ReviewState::kDetected);
  assert(!sleep.duplicate_flag);

  const auto& bottle = parsed->candidates[1];
  assert(bottle.kind == EventKind::kFeed);
  assert(bottle.quantity_text == "4oz");
  assert(!bottle.end_time.has_value());

  const auto& diaper = parsed->candidates[2];
  assert(diaper.wet && !diaper.dirty);

  std::set<std::string> ids;
  for (const auto& candidate : parsed->candidates) ids.insert(candidate.id);
  assert(ids.size() == 3);
}

void TestEventsObjectAndLenientValues() {
  auto parsed = ParseModelOutput(
      R"({"events": [{"type": "nursing", "start_time": "8:05 am", "quantity": 15, "details": "Left side"},
                     {"type": "diaper", "startTime": "1:30 PM", "is_dirty": "yes"}]})",
      kDay);
  assert(parsed.ok());
  assert(parsed->candidates.size() == 2);
  assert(parsed->candidates[0].start_time == T(8h + 5min));
  assert(parsed->candidates[0].quantity_text == "15");
  assert(parsed->candidates[1].start_time == T(13h + 30min));
  assert(parsed->candidates[1].dirty && !parsed->candidates[1].wet);
}

void TestUnusableEntriesAreDropped() {
  auto parsed = ParseModelOutput(R"([
    {"type": "feed", "startTime": "noon"},
    "not an object",
    {"type": "feed", "details": "no time"},
    {"type": "feed", "startTime": "25:00"},
    {"type": "activity", "startTime": "10:00", "details": "Painting", "quantity": "  "}
  ])",
                                 kDay);
  assert(parsed.ok());
  assert(parsed->candidates.size() == 1);
  assert(parsed->dropped.size() == 4);
  assert(parsed->dropped[0].index == 0);
  assert(parsed->dropped[1].index == 1);
  assert(parsed->dropped[1].reason == "entry is not an object");
  assert(parsed->candidates[0].kind == EventKind::kActivity);
  assert(!parsed->candidates[0].quantity_text.has_value());
}

void TestEndTimeRules() {
  carelog::v1::ExtractedEvent overnight;
  overnight.set_type("sleep");
  overnight.set_start_time("23:30");
  overnight.set_end_time("01:00");
  auto crossing = ToCandidate(overnight, kDay);
  assert(crossing.ok());
  assert(crossing->end_time == T(25h));

  carelog::v1::ExtractedEvent same;
  same.set_type("sleep");
  same.set_start_time("13:00");
  same.set_end_time("13:00");
  assert(!ToCandidate(same, kDay)->end_time.has_value());

  carelog::v1::ExtractedEvent garbled;
  garbled.set_type("sleep");
  garbled.set_start_time("13:00");
  garbled.set_end_time("later");
  auto cleared = ToCandidate(garbled, kDay);
  assert(cleared.ok() && !cleared->end_time.has_value());

  carelog::v1::ExtractedEvent feed;
  feed.set_type("bottle");
  feed.set_start_time("9:00");
  feed.set_end_time("9:20");
  feed.set_is_wet(true);
  auto instant = ToCandidate(feed, kDay);
  assert(!instant->end_time.has_value());
  assert(!instant->wet);
}

void TestMalformedOutput() {
  assert(ParseModelOutput("", kDay).status().code == StatusCode::kMalformedResponse);
  assert(ParseModelOutput("I could not read this report.", kDay).status().code == StatusCode::kMalformedResponse);
  assert(ParseModelOutput(R"({"type": "sleep"})", kDay).status().code == StatusCode::kMalformedResponse);
  assert(ParseModelOutput("[{\"type\": \"sleep\",", kDay).status().code == StatusCode::kMalformedResponse);
  assert(ParseModelOutput(R"([{"type": "feed"}, {"startTime": "??"}])", kDay).status().code == StatusCode::kMalformedResponse);
}

void TestEmptyListIsSuccess() {
  auto parsed = ParseModelOutput("```json\n[]\n```", kDay);
  assert(parsed.ok());
  assert(parsed->candidates.empty());
  assert(parsed->dropped.empty());
}

} // namespace

int main() {
  TestCodeFencesAreStripped();
  TestTypeMapping();
  TestWellFormedArray();
  TestEventsObjectAndLenientValues();
  TestUnusableEntriesAreDropped();
  TestEndTimeRules();
  TestMalformedOutput();
  TestEmptyListIsSuccess();

  std::cout << "carelog_unit_extraction_parser: pass\n";
  return 0;
}
