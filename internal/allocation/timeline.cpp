#include "timeline.hpp"

#include <cmath>

namespace planner::allocation {

namespace {
// Used when a schedule reports no working hours at all.
constexpr double kFallbackHoursPerDay = 8.0;
} // namespace

Interval ProjectInterval(Timeline timeline, util::TimePoint base_start, double occupied_hours, double duration_hours,
                         double hours_per_day) {
  Interval interval;

  if (timeline == Timeline::kContinuousHours) {
    interval.start = util::AddHours(base_start, occupied_hours);
    interval.end   = util::AddHours(interval.start, duration_hours);
    return interval;
  }

  const double per_day = hours_per_day > 0.0 ? hours_per_day : kFallbackHoursPerDay;

  const auto prior_days  = static_cast<std::int64_t>(std::floor(occupied_hours / per_day));
  const auto needed_days = static_cast<std::int64_t>(std::ceil(duration_hours / per_day));

  interval.start = util::AddDays(base_start, prior_days);
  // One buffer day of slack on top of the working days needed.
  interval.end = util::AddDays(interval.start, needed_days + 1);
  return interval;
}

} // namespace planner::allocation
