#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "internal/capacity/capacity_estimator.hpp"
#include "internal/model/assignment.hpp"
#include "internal/model/constraints.hpp"
#include "internal/model/process.hpp"
#include "internal/model/resource.hpp"
#include "internal/model/types.hpp"
#include "internal/optimization/optimization_params.hpp"
#include "internal/report/metrics.hpp"
#include "internal/report/recommendations.hpp"
#include "internal/util/time.hpp"

namespace planner::core {

/*
  Defaults applied when a call leaves something unset.
*/
struct EngineOptions {
  model::Strategy                  default_strategy = model::Strategy::kBalanced;
  std::optional<double>            default_max_hours_per_resource;
  std::optional<int>               default_max_processes_per_resource;
  optimization::OptimizationParams optimization;
  report::RecommendationThresholds recommendations;
};

struct DistributionReport {
  model::Strategy                strategy = model::Strategy::kBalanced;
  std::vector<model::Assignment> assignments;
  std::vector<model::Process>    unassigned;
  std::size_t                    eligible_resources = 0;
  report::DistributionMetrics    metrics;
  std::vector<std::string>       recommendations;
};

/*
  Entry point for collaborators (API layer, spreadsheet import, GUI).

  Every call is synchronous and works on the caller's in-memory records
  without modifying them. Validation errors (util::ValidationError) surface
  unchanged; any other failure is logged and rethrown as AllocationFailed or
  OptimizationFailed with the cause nested.
*/
class PlannerEngine {
 public:
  explicit PlannerEngine(EngineOptions options = {});

  capacity::CapacityReport ComputeCapacity(const capacity::PlanningWindow& window, const std::vector<model::Resource>& resources,
                                           const std::vector<model::Process>&         processes,
                                           const std::optional<model::ConstraintSet>& restrictions = std::nullopt,
                                           util::TimePoint                            now          = util::Now()) const;

  DistributionReport Distribute(const std::vector<model::Process>& processes, const std::vector<model::Resource>& resources,
                                std::optional<model::Strategy>             strategy     = std::nullopt,
                                const std::optional<model::ConstraintSet>& restrictions = std::nullopt,
                                std::optional<util::TimePoint>             base_start   = std::nullopt) const;

  // Unset params use the engine's optimization defaults.
  optimization::OptimizationResult Optimize(const std::vector<model::Process>& processes, const std::vector<model::Resource>& resources,
                                            const std::optional<optimization::OptimizationParams>& params = std::nullopt) const;

  const EngineOptions& options() const { return options_; }

 private:
  model::ConstraintSet WithDefaults(const std::optional<model::ConstraintSet>& restrictions) const;

  EngineOptions options_;
};

} // namespace planner::core
