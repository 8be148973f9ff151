#pragma once

#include <cstddef>
#include <vector>

#include "internal/model/assignment.hpp"

namespace planner::report {

// Summary of a Distribute run.
struct DistributionMetrics {
  double      efficiency           = 0.0; // work hours / makespan, percent, capped at 100
  double      total_cost           = 0.0;
  double      total_hours          = 0.0; // makespan
  double      resource_utilization = 0.0; // resources used / resources given, percent
  double      work_hours           = 0.0;
  std::size_t resources_used       = 0;
  double      average_hourly_cost  = 0.0;
};

// Summary attached to every optimization result.
struct SolutionMetrics {
  double      total_cost       = 0.0;
  double      makespan_hours   = 0.0;
  std::size_t assignment_count = 0;
  double      average_cost     = 0.0;
  std::size_t resources_used   = 0;
};

// max(end) - min(start) in hours; 0 for an empty set.
double MakespanHours(const std::vector<model::Assignment>& assignments);

double TotalCost(const std::vector<model::Assignment>& assignments);

std::size_t DistinctResources(const std::vector<model::Assignment>& assignments);

DistributionMetrics ComputeDistributionMetrics(const std::vector<model::Assignment>& assignments, std::size_t total_resources);

SolutionMetrics ComputeSolutionMetrics(const std::vector<model::Assignment>& assignments);

} // namespace planner::report
