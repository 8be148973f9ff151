#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/constraints.hpp"
#include "internal/model/process.hpp"
#include "internal/model/resource.hpp"
#include "internal/util/time.hpp"

namespace planner::capacity {

// Half-open planning window [start, end).
struct PlanningWindow {
  util::TimePoint start{};
  util::TimePoint end{};
};

struct ResourceCapacity {
  std::string resource_id;
  std::string resource_name;
  double      available_hours  = 0.0;
  int         process_capacity = 0;
};

struct CapacityReport {
  int                           possible_process_count = 0;
  std::vector<ResourceCapacity> per_resource;
  double                        total_available_hours = 0.0;
  double                        total_required_hours  = 0.0;
  double                        projected_efficiency  = 0.0;
  int                           working_days          = 0;
  std::vector<std::string>      recommendations;
};

/*
  Rough upper bound on how much work a resource pool can absorb in a window.

  Weekends are never working days, whatever the resources' schedules say.
*/
class CapacityEstimator {
 public:
  // Throws util::InvalidWindow, util::NoResources, util::PastWindow and
  // util::InvalidRestriction.
  static CapacityReport Estimate(const PlanningWindow& window, const std::vector<model::Resource>& resources,
                                 const std::vector<model::Process>&         processes,
                                 const std::optional<model::ConstraintSet>& restrictions = std::nullopt,
                                 util::TimePoint                            now          = util::Now());

  // Mon-Fri days d with start <= d < end, stepping one calendar day at a time.
  static int CountWorkingDays(util::TimePoint start, util::TimePoint end);
};

} // namespace planner::capacity
