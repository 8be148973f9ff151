#include "metrics.hpp"

#include <algorithm>
#include <string>
#include <unordered_set>

namespace planner::report {

double MakespanHours(const std::vector<model::Assignment>& assignments) {
  if (assignments.empty()) {
    return 0.0;
  }

  auto first_start = assignments.front().start_time;
  auto last_end    = assignments.front().end_time;
  for (const auto& assignment : assignments) {
    first_start = std::min(first_start, assignment.start_time);
    last_end    = std::max(last_end, assignment.end_time);
  }
  return util::HoursBetween(first_start, last_end);
}

double TotalCost(const std::vector<model::Assignment>& assignments) {
  double total = 0.0;
  for (const auto& assignment : assignments) {
    total += assignment.estimated_cost;
  }
  return total;
}

std::size_t DistinctResources(const std::vector<model::Assignment>& assignments) {
  std::unordered_set<std::string> ids;
  for (const auto& assignment : assignments) {
    ids.insert(assignment.resource_id);
  }
  return ids.size();
}

DistributionMetrics ComputeDistributionMetrics(const std::vector<model::Assignment>& assignments, std::size_t total_resources) {
  DistributionMetrics metrics;
  if (assignments.empty()) {
    return metrics;
  }

  metrics.total_cost     = TotalCost(assignments);
  metrics.total_hours    = MakespanHours(assignments);
  metrics.resources_used = DistinctResources(assignments);

  for (const auto& assignment : assignments) {
    metrics.work_hours += assignment.hours_assigned;
  }

  if (metrics.total_hours > 0.0) {
    metrics.efficiency = std::min(100.0, metrics.work_hours / metrics.total_hours * 100.0);
  }
  if (total_resources > 0) {
    metrics.resource_utilization = static_cast<double>(metrics.resources_used) / static_cast<double>(total_resources) * 100.0;
  }
  if (metrics.work_hours > 0.0) {
    metrics.average_hourly_cost = metrics.total_cost / metrics.work_hours;
  }

  return metrics;
}

SolutionMetrics ComputeSolutionMetrics(const std::vector<model::Assignment>& assignments) {
  SolutionMetrics metrics;
  if (assignments.empty()) {
    return metrics;
  }

  metrics.total_cost       = TotalCost(assignments);
  metrics.makespan_hours   = MakespanHours(assignments);
  metrics.assignment_count = assignments.size();
  metrics.average_cost     = metrics.total_cost / static_cast<double>(assignments.size());
  metrics.resources_used   = DistinctResources(assignments);
  return metrics;
}

} // namespace planner::report
