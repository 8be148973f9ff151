#include "time.hpp"

#include <spdlog/fmt/fmt.h>

namespace planner::util {

using Hours = std::chrono::duration<double, std::ratio<3600>>;

TimePoint Now() {
  return Clock::now();
}

TimePoint StartOfDay(TimePoint tp) {
  return std::chrono::floor<std::chrono::days>(tp);
}

int Weekday(TimePoint tp) {
  const std::chrono::weekday day{std::chrono::floor<std::chrono::days>(tp)};
  // iso_encoding: Monday = 1 ... Sunday = 7.
  return static_cast<int>(day.iso_encoding()) - 1;
}

TimePoint AddHours(TimePoint tp, double hours) {
  return tp + std::chrono::duration_cast<Clock::duration>(Hours(hours));
}

TimePoint AddDays(TimePoint tp, std::int64_t days) {
  return tp + std::chrono::days(days);
}

double HoursBetween(TimePoint from, TimePoint to) {
  return Hours(to - from).count();
}

std::string FormatTimestamp(TimePoint tp) {
  const auto day = std::chrono::floor<std::chrono::days>(tp);
  const std::chrono::year_month_day date{day};
  const std::chrono::hh_mm_ss time{std::chrono::floor<std::chrono::seconds>(tp - day)};

  return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}", static_cast<int>(date.year()), static_cast<unsigned>(date.month()),
                     static_cast<unsigned>(date.day()), time.hours().count(), time.minutes().count(), time.seconds().count());
}

} // namespace planner::util
