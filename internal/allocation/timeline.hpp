#pragma once

#include <cstdint>

#include "internal/util/time.hpp"

namespace planner::allocation {

/*
  How an assignment's interval is laid out from the resource's occupied hours.

  kWorkingDays:     start = base + floor(occupied / hoursPerDay) days,
                    end   = start + ceil(duration / hoursPerDay) + 1 days.
  kContinuousHours: start = base + occupied hours,
                    end   = start + duration hours.
*/
enum class Timeline : std::uint8_t {
  kWorkingDays     = 0,
  kContinuousHours = 1,
};

struct Interval {
  util::TimePoint start{};
  util::TimePoint end{};
};

Interval ProjectInterval(Timeline timeline, util::TimePoint base_start, double occupied_hours, double duration_hours,
                         double hours_per_day);

} // namespace planner::allocation
