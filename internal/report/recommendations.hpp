#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "internal/model/assignment.hpp"
#include "internal/report/metrics.hpp"

namespace planner::report {

struct RecommendationThresholds {
  double high_average_cost       = 1000.0;
  double low_efficiency_percent  = 60.0;
  double high_efficiency_percent = 90.0;
};

/*
  Plain-text advice derived from a finished distribution.
*/
std::vector<std::string> DistributionRecommendations(const std::vector<model::Assignment>& assignments, std::size_t unassigned_count,
                                                     std::size_t eligible_resource_count, const DistributionMetrics& metrics,
                                                     const RecommendationThresholds& thresholds = {});

} // namespace planner::report
