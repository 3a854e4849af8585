#include "domain_record.hpp"

namespace carelog::store {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

model::EventKind KindOf(const DomainRecord& record) {
  return std::visit(Overloaded{
                        [](const SleepRecord&) { return model::EventKind::kSleep; },
                        [](const BottleFeedRecord&) { return model::EventKind::kFeed; },
                        [](const NursingRecord&) { return model::EventKind::kFeed; },
                        [](const DiaperRecord&) { return model::EventKind::kDiaper; },
                        [](const ActivityRecord&) { return model::EventKind::kActivity; },
                    },
                    record);
}

std::string_view TableOf(const DomainRecord& record) {
  return std::visit(Overloaded{
                        [](const SleepRecord&) { return std::string_view("sleep_log"); },
                        [](const BottleFeedRecord&) { return std::string_view("bottle_feed_log"); },
                        [](const NursingRecord&) { return std::string_view("nursing_log"); },
                        [](const DiaperRecord&) { return std::string_view("diaper_log"); },
                        [](const ActivityRecord&) { return std::string_view("activity_log"); },
                    },
                    record);
}

std::string_view ToString(SleepQuality quality) {
  switch (quality) {
    case SleepQuality::kPoor:
      return "poor";
    case SleepQuality::kFair:
      return "fair";
    case SleepQuality::kGood:
      return "good";
    case SleepQuality::kExcellent:
      return "excellent";
  }
  return "fair";
}

std::string_view ToString(FeedType feed_type) {
  switch (feed_type) {
    case FeedType::kBreastMilk:
      return "breast_milk";
    case FeedType::kFormula:
      return "formula";
    case FeedType::kMixed:
      return "mixed";
  }
  return "formula";
}

std::string_view ToString(NursingSide side) {
  switch (side) {
    case NursingSide::kLeft:
      return "left";
    case NursingSide::kRight:
      return "right";
    case NursingSide::kUnknown:
      break;
  }
  return "unknown";
}

std::string_view ToString(DiaperType type) {
  switch (type) {
    case DiaperType::kWet:
      return "wet";
    case DiaperType::kDirty:
      return "dirty";
    case DiaperType::kBoth:
      return "both";
  }
  return "wet";
}

std::optional<DiaperType> ParseDiaperType(std::string_view name) {
  if (name == "wet") return DiaperType::kWet;
  if (name == "dirty") return DiaperType::kDirty;
  if (name == "both") return DiaperType::kBoth;
  return std::nullopt;
}

std::optional<SleepQuality> ParseSleepQuality(std::string_view name) {
  if (name == "poor") return SleepQuality::kPoor;
  if (name == "fair") return SleepQuality::kFair;
  if (name == "good") return SleepQuality::kGood;
  if (name == "excellent") return SleepQuality::kExcellent;
  return std::nullopt;
}

} // namespace carelog::store
