#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace casetrack::util {

/*
  Time utilities. Single place to control clock source.

  Components take a ClockFn so tests can drive expiry deterministically.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using ClockFn   = std::function<TimePoint()>;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// UTC calendar day as YYYYMMDD.
std::string FormatDay(TimePoint tp);

// Parses YYYY-MM-DD; throws InvalidArgument on malformed input.
std::chrono::sys_days ParseIsoDate(const std::string& value);

// Human form of a duration for audit text: "2 hours", "15 minutes", "30 seconds".
std::string DescribeDuration(std::chrono::milliseconds duration);

} // namespace casetrack::util
