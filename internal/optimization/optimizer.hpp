#pragma once

#include <vector>

#include "internal/model/process.hpp"
#include "internal/model/resource.hpp"
#include "internal/optimization/optimization_params.hpp"

namespace planner::optimization {

/*
  Runs one search over an immutable snapshot of processes and resources.

  Each call owns its generator, ledger and population; calls share nothing.
*/
class Optimizer {
 public:
  static constexpr double kWeightSumTolerance = 1e-6;

  // Throws util::InvalidParameters.
  static void Validate(const std::vector<model::Process>& processes, const std::vector<model::Resource>& resources,
                       const OptimizationParams& params);

  static OptimizationResult Run(const std::vector<model::Process>& processes, const std::vector<model::Resource>& resources,
                                const OptimizationParams& params);
};

} // namespace planner::optimization
