#include "time.hpp"

#include <cstdio>

#include "internal/util/errors.hpp"

namespace casetrack::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

std::string FormatDay(TimePoint tp) {
  const std::chrono::year_month_day ymd{std::chrono::floor<std::chrono::days>(tp)};

  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d%02u%02u", static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()));
  return buf;
}

std::chrono::sys_days ParseIsoDate(const std::string& value) {
  int      year  = 0;
  unsigned month = 0;
  unsigned day   = 0;
  char     tail  = 0;

  if (value.size() != 10 || std::sscanf(value.c_str(), "%4d-%2u-%2u%c", &year, &month, &day, &tail) != 3) {
    throw InvalidArgument("expected date in YYYY-MM-DD form, got '" + value + "'");
  }

  const std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
  if (!ymd.ok()) {
    throw InvalidArgument("invalid calendar date '" + value + "'");
  }
  return std::chrono::sys_days{ymd};
}

std::string DescribeDuration(std::chrono::milliseconds duration) {
  using namespace std::chrono;

  auto plural = [](long long n, const char* unit) {
    return std::to_string(n) + " " + unit + (n == 1 ? "" : "s");
  };

  if (duration >= hours(1) && duration % hours(1) == milliseconds::zero()) {
    return plural(duration_cast<hours>(duration).count(), "hour");
  }
  if (duration >= minutes(1) && duration % minutes(1) == milliseconds::zero()) {
    return plural(duration_cast<minutes>(duration).count(), "minute");
  }
  return plural(duration_cast<seconds>(duration).count(), "second");
}

} // namespace casetrack::util
