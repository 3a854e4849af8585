#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace carelog::util {

/*
  Time utilities.

  Care-log timestamps are floating wall-clock times: a report's "9:15" on
  2024-03-05 is stored as sys_days{2024-03-05} + 9h15m on the system clock,
  with no time zone attached. Formatting reads them back the same way.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Day       = std::chrono::sys_days;

TimePoint Now();

// Calendar date of tp on the local wall clock (TZ), not in UTC.
Day LocalDay(TimePoint tp);
// LocalDay(Now()): the default reference day of a report.
Day Today();

std::int64_t ToUnixMillis(TimePoint tp);
TimePoint    FromUnixMillis(std::int64_t millis);

// "YYYY-MM-DD"
std::string        FormatDate(Day day);
std::optional<Day> ParseDate(std::string_view text);

// "HH:MM", 24h
std::string FormatClockTime(TimePoint tp);

// "YYYY-MM-DD HH:MM"
std::string FormatDateTime(TimePoint tp);

// Minutes past midnight for "H:mm" / "HH:mm", optionally followed by AM/PM.
std::optional<std::chrono::minutes> ParseClockTime(std::string_view text);

inline TimePoint At(Day day, std::chrono::minutes since_midnight) {
  return TimePoint{day} + since_midnight;
}

} // namespace carelog::util
