#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "internal/model/event_kind.hpp"
#include "internal/model/quantity.hpp"
#include "internal/util/time.hpp"

namespace carelog::store {

enum class SleepQuality : std::uint8_t { kPoor, kFair, kGood, kExcellent };
enum class FeedType : std::uint8_t { kBreastMilk, kFormula, kMixed };
enum class NursingSide : std::uint8_t { kUnknown, kLeft, kRight };
enum class DiaperType : std::uint8_t { kWet, kDirty, kBoth };

struct SleepRecord {
  util::TimePoint start_time{};
  util::TimePoint end_time{};
  SleepQuality    quality = SleepQuality::kFair;
};

struct BottleFeedRecord {
  util::TimePoint     time{};
  double              amount = 0.0;
  model::QuantityUnit unit   = model::QuantityUnit::kOunce;
  FeedType            feed_type = FeedType::kFormula;
  std::string         notes;
};

struct NursingRecord {
  util::TimePoint time{};
  double          duration_minutes = 0.0;
  NursingSide     side = NursingSide::kUnknown;
  std::string     notes;
};

struct DiaperRecord {
  util::TimePoint time{};
  DiaperType      type = DiaperType::kWet;
};

struct ActivityRecord {
  util::TimePoint            time{};
  std::string                activity_type;
  std::string                description;
  std::optional<std::string> notes;
};

using DomainRecord = std::variant<SleepRecord, BottleFeedRecord, NursingRecord, DiaperRecord, ActivityRecord>;

// Store that owns the record: bottle and nursing both belong to feed.
model::EventKind KindOf(const DomainRecord& record);

// Table-style name: sleep_log, bottle_feed_log, nursing_log, diaper_log, activity_log
std::string_view TableOf(const DomainRecord& record);

std::string_view ToString(SleepQuality quality);
std::string_view ToString(FeedType feed_type);
std::string_view ToString(NursingSide side);
std::string_view ToString(DiaperType type);

std::optional<DiaperType>  ParseDiaperType(std::string_view name);
std::optional<SleepQuality> ParseSleepQuality(std::string_view name);

// Reference returned by a successful append: "<table>/<id>".
struct RecordReference {
  std::string table;
  std::string id;

  std::string ToString() const {
    return table + "/" + id;
  }
};

} // namespace carelog::store
