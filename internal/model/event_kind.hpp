#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace carelog::model {

enum class EventKind : std::uint8_t {
  kSleep = 0,
  kFeed = 1,
  kDiaper = 2,
  kActivity = 3,
  kOther = 4,
};

constexpr std::string_view ToString(EventKind kind) {
  switch (kind) {
    case EventKind::kSleep:
      return "sleep";
    case EventKind::kFeed:
      return "feed";
    case EventKind::kDiaper:
      return "diaper";
    case EventKind::kActivity:
      return "activity";
    case EventKind::kOther:
    default:
      return "other";
  }
}

constexpr std::optional<EventKind> ParseEventKind(std::string_view name) {
  if (name == "sleep") return EventKind::kSleep;
  if (name == "feed") return EventKind::kFeed;
  if (name == "diaper") return EventKind::kDiaper;
  if (name == "activity") return EventKind::kActivity;
  if (name == "other") return EventKind::kOther;
  return std::nullopt;
}

// Only sleep spans an interval; every other kind is a point in time.
constexpr bool HasInterval(EventKind kind) {
  return kind == EventKind::kSleep;
}

}  // namespace carelog::model
