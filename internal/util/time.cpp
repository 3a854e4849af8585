#include "time.hpp"

#include <cctype>
#include <charconv>
#include <cstdio>
#include <ctime>

namespace carelog::util {
namespace {

std::string_view Trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
  return text;
}

std::optional<int> ParseInt(std::string_view digits) {
  if (digits.empty()) return std::nullopt;
  for (char c : digits) {
    if (c < '0' || c > '9') return std::nullopt;
  }
  int value   = 0;
  auto [p, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (ec != std::errc{} || p != digits.data() + digits.size()) return std::nullopt;
  return value;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

Day LocalDay(TimePoint tp) {
  const std::time_t seconds = Clock::to_time_t(tp);
  std::tm           local{};
  localtime_r(&seconds, &local);
  return Day{std::chrono::year{local.tm_year + 1900} / static_cast<unsigned>(local.tm_mon + 1) /
             static_cast<unsigned>(local.tm_mday)};
}

Day Today() {
  return LocalDay(Now());
}

std::int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(std::int64_t millis) {
  return TimePoint{} + std::chrono::milliseconds(millis);
}

std::string FormatDate(Day day) {
  const std::chrono::year_month_day ymd{day};
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()));
  return buf;
}

std::optional<Day> ParseDate(std::string_view text) {
  text = Trim(text);
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') return std::nullopt;

  auto y = ParseInt(text.substr(0, 4));
  auto m = ParseInt(text.substr(5, 2));
  auto d = ParseInt(text.substr(8, 2));
  if (!y || !m || !d) return std::nullopt;

  const std::chrono::year_month_day ymd{std::chrono::year{*y}, std::chrono::month{static_cast<unsigned>(*m)},
                                        std::chrono::day{static_cast<unsigned>(*d)}};
  if (!ymd.ok()) return std::nullopt;
  return Day{ymd};
}

std::string FormatClockTime(TimePoint tp) {
  const auto day     = std::chrono::floor<std::chrono::days>(tp);
  const auto minutes = std::chrono::duration_cast<std::chrono::minutes>(tp - day).count();
  char buf[8];
  std::snprintf(buf, sizeof(buf), "%02d:%02d", static_cast<int>(minutes / 60), static_cast<int>(minutes % 60));
  return buf;
}

std::string FormatDateTime(TimePoint tp) {
  return FormatDate(std::chrono::floor<std::chrono::days>(tp)) + " " + FormatClockTime(tp);
}

std::optional<std::chrono::minutes> ParseClockTime(std::string_view text) {
  text = Trim(text);

  // optional meridiem suffix
  int meridiem = 0; // 0 none, 1 am, 2 pm
  if (text.size() >= 2) {
    const char a = static_cast<char>(std::tolower(static_cast<unsigned char>(text[text.size() - 2])));
    const char b = static_cast<char>(std::tolower(static_cast<unsigned char>(text.back())));
    if (b == 'm' && (a == 'a' || a == 'p')) {
      meridiem = a == 'a' ? 1 : 2;
      text     = Trim(text.substr(0, text.size() - 2));
    }
  }

  const auto colon = text.find(':');
  if (colon == std::string_view::npos) return std::nullopt;

  const auto hour_text   = text.substr(0, colon);
  const auto minute_text = text.substr(colon + 1);
  if (hour_text.empty() || hour_text.size() > 2 || minute_text.size() != 2) return std::nullopt;

  auto hour   = ParseInt(hour_text);
  auto minute = ParseInt(minute_text);
  if (!hour || !minute || *minute > 59) return std::nullopt;

  if (meridiem != 0) {
    if (*hour < 1 || *hour > 12) return std::nullopt;
    if (*hour == 12) *hour = 0;
    if (meridiem == 2) *hour += 12;
  } else if (*hour > 23) {
    return std::nullopt;
  }

  return std::chrono::minutes(*hour * 60 + *minute);
}

} // namespace carelog::util
