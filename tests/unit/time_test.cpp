#include "internal/util/time.hpp"

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <string>

namespace {

using namespace std::chrono_literals;

using carelog::util::Day;
using carelog::util::FormatDate;
using carelog::util::LocalDay;

const Day kDay{std::chrono::year{2026} / 10 / 19};

// POSIX TZ strings need no tzdata: "XYZ-14" is UTC+14, "XYZ+10" is UTC-10.
void SetZone(const char* tz) {
  setenv("TZ", tz, 1);
  tzset();
}

std::string LocalDateViaStrftime() {
  const std::time_t now = std::time(nullptr);
  std::tm           local{};
  localtime_r(&now, &local);
  char buf[16];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d", &local);
  return buf;
}

void TestLocalDayAheadOfUtc() {
  SetZone("XYZ-14");
  // 23:00 UTC on the 19th is 13:00 on the 20th in UTC+14
  assert(FormatDate(LocalDay(carelog::util::At(kDay, 23h))) == "2026-10-20");
  assert(FormatDate(LocalDay(carelog::util::At(kDay, 5h))) == "2026-10-19");
}

void TestLocalDayBehindUtc() {
  SetZone("XYZ+10");
  // 05:00 UTC on the 19th is 19:00 on the 18th in UTC-10
  assert(FormatDate(LocalDay(carelog::util::At(kDay, 5h))) == "2026-10-18");
  assert(FormatDate(LocalDay(carelog::util::At(kDay, 12h))) == "2026-10-19");
}

void TestTodayFollowsLocalCalendar() {
  for (const char* tz : {"XYZ-14", "XYZ+12", "UTC0"}) {
    SetZone(tz);
    const auto expected = LocalDateViaStrftime();
    const auto today    = FormatDate(carelog::util::Today());
    // a midnight between the two reads is the only allowed difference
    assert(today == expected || today == LocalDateViaStrftime());
  }
}

void TestUtcZoneMatchesSystemDay() {
  SetZone("UTC0");
  assert(LocalDay(carelog::util::At(kDay, 23h + 59min)) == kDay);
  assert(LocalDay(carelog::util::At(kDay, 0min)) == kDay);
}

} // namespace

int main() {
  TestLocalDayAheadOfUtc();
  TestLocalDayBehindUtc();
  TestTodayFollowsLocalCalendar();
  TestUtcZoneMatchesSystemDay();

  std::cout << "carelog_unit_time: pass\n";
  return 0;
}
