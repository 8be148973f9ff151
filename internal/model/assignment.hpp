#pragma once

#include <string>

#include "internal/util/time.hpp"

namespace planner::model {

/*
  A committed (process, resource, hours, interval, cost) tuple.

  Produced only by the allocator and the search algorithms.
*/
struct Assignment {
  std::string     process_id;
  std::string     resource_id;
  double          hours_assigned = 0.0;
  util::TimePoint start_time{};
  util::TimePoint end_time{};
  int             priority       = 0;
  double          estimated_cost = 0.0;

  bool operator==(const Assignment&) const = default;
};

} // namespace planner::model
