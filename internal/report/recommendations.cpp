#include "recommendations.hpp"

namespace planner::report {

std::vector<std::string> DistributionRecommendations(const std::vector<model::Assignment>& assignments, std::size_t unassigned_count,
                                                     std::size_t eligible_resource_count, const DistributionMetrics& metrics,
                                                     const RecommendationThresholds& thresholds) {
  std::vector<std::string> out;

  if (unassigned_count > 0) {
    out.push_back(std::to_string(unassigned_count) +
                  " processes could not be assigned. Consider adding resources or relaxing the restrictions.");
  }

  if (eligible_resource_count > 0) {
    const auto used = DistinctResources(assignments);
    if (eligible_resource_count > used) {
      out.push_back(std::to_string(eligible_resource_count - used) +
                    " eligible resources were left unused. Consider redistributing the workload.");
    }
  }

  if (assignments.empty()) {
    return out;
  }

  if (metrics.efficiency < thresholds.low_efficiency_percent) {
    out.emplace_back("Efficiency is low. Consider adjusting the distribution strategy or the restrictions.");
  } else if (metrics.efficiency > thresholds.high_efficiency_percent) {
    out.emplace_back("Excellent efficiency. Consider planning additional processes.");
  }

  const double average_cost = metrics.total_cost / static_cast<double>(assignments.size());
  if (average_cost > thresholds.high_average_cost) {
    out.emplace_back("Costs are high. Consider cheaper resources or reviewing process durations.");
  }

  return out;
}

} // namespace planner::report
