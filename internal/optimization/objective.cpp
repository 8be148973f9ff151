#include "objective.hpp"

#include <limits>

#include "internal/report/metrics.hpp"

namespace planner::optimization {

double Objective(const std::vector<model::Assignment>& assignments, const ObjectiveWeights& weights) {
  if (assignments.empty()) {
    return std::numeric_limits<double>::infinity();
  }

  const auto   count    = static_cast<double>(assignments.size());
  const double makespan = report::MakespanHours(assignments);

  const double normalized_cost = report::TotalCost(assignments) / count;
  const double normalized_time = makespan / count;
  const double throughput      = makespan > 0.0 ? count / makespan : 0.0;

  return weights.cost * normalized_cost + weights.time * normalized_time - weights.efficiency * throughput;
}

} // namespace planner::optimization
