#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace planner::util {

/*
  Time utilities. Single clock source; calendar math in UTC.

  Calendar arithmetic goes through std::chrono sys_days on system_clock
  time points.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

// Midnight (UTC) of the day containing tp.
TimePoint StartOfDay(TimePoint tp);

// 0 = Monday ... 6 = Sunday.
int Weekday(TimePoint tp);

TimePoint AddHours(TimePoint tp, double hours);
TimePoint AddDays(TimePoint tp, std::int64_t days);

double HoursBetween(TimePoint from, TimePoint to);

// "YYYY-MM-DD HH:MM:SS" in UTC.
std::string FormatTimestamp(TimePoint tp);

} // namespace planner::util
