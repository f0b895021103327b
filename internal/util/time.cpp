#include "time.hpp"

#include <cmath>

namespace deliveryiq::util {

namespace {

std::chrono::sys_days ToDays(int64_t ms) {
  return std::chrono::floor<std::chrono::days>(FromUnixMillis(ms));
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

double DaysBetween(int64_t from_ms, int64_t to_ms) {
  return static_cast<double>(to_ms - from_ms) / static_cast<double>(kMillisPerDay);
}

int64_t WholeDaysBetween(int64_t from_ms, int64_t to_ms) {
  return static_cast<int64_t>(std::floor(DaysBetween(from_ms, to_ms)));
}

unsigned UtcMonth(int64_t ms) {
  const std::chrono::year_month_day ymd{ToDays(ms)};
  return static_cast<unsigned>(ymd.month());
}

unsigned IsoWeek(int64_t ms) {
  using namespace std::chrono;

  const sys_days day      = ToDays(ms);
  const auto     iso_day  = weekday{day}.iso_encoding(); // Monday=1 .. Sunday=7
  const sys_days thursday = day + days{4 - static_cast<int>(iso_day)};

  const year     iso_year = year_month_day{thursday}.year();
  const sys_days jan1     = sys_days{iso_year / January / 1};
  return static_cast<unsigned>((thursday - jan1).count() / 7 + 1);
}

} // namespace deliveryiq::util
