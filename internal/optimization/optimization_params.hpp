#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

#include "internal/model/assignment.hpp"
#include "internal/model/types.hpp"
#include "internal/optimization/objective.hpp"
#include "internal/report/metrics.hpp"
#include "internal/util/time.hpp"

namespace planner::optimization {

struct OptimizationParams {
  model::Algorithm algorithm      = model::Algorithm::kGreedy;
  int              max_iterations = 1000;
  double           tolerance      = 1e-6;
  ObjectiveWeights weights{};

  // Unset: seeded from std::random_device, runs are not reproducible.
  std::optional<std::uint64_t> random_seed;

  // Unset: the time Optimize is called.
  std::optional<util::TimePoint> base_start;

  // Wall-clock budget, checked between iterations.
  std::optional<std::chrono::milliseconds> time_budget;
};

struct OptimizationResult {
  std::vector<model::Assignment> assignments;
  double                         objective_value     = 0.0;
  std::chrono::duration<double>  elapsed             = std::chrono::duration<double>::zero();
  int                            iterations          = 0;
  bool                           converged           = false;
  model::Algorithm               algorithm_requested = model::Algorithm::kGreedy;
  model::Algorithm               algorithm_used      = model::Algorithm::kGreedy;
  bool                           fell_back           = false;
  report::SolutionMetrics        metrics;
};

} // namespace planner::optimization
