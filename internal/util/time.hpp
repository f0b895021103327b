#pragma once

#include <chrono>
#include <cstdint>

namespace deliveryiq::util {

/*
  Time utilities, single place to control the clock source.

  Timestamps cross the repository boundary as unix epoch milliseconds.
  Calendar helpers always use UTC.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

inline constexpr int64_t kMillisPerDay = 24LL * 60 * 60 * 1000;

TimePoint Now();

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

// Fractional days from `from_ms` to `to_ms` (negative when to < from).
double DaysBetween(int64_t from_ms, int64_t to_ms);

// Whole days elapsed, rounded toward negative infinity.
int64_t WholeDaysBetween(int64_t from_ms, int64_t to_ms);

// 1..12
unsigned UtcMonth(int64_t ms);

// ISO-8601 week number, 1..53
unsigned IsoWeek(int64_t ms);

} // namespace deliveryiq::util
