#include "optimizer.hpp"

#include <chrono>
#include <cmath>
#include <random>
#include <utility>

#include "internal/optimization/search_factory.hpp"
#include "internal/report/metrics.hpp"
#include "internal/util/errors.hpp"

namespace planner::optimization {

void Optimizer::Validate(const std::vector<model::Process>& processes, const std::vector<model::Resource>& resources,
                         const OptimizationParams& params) {
  if (processes.empty()) {
    throw util::InvalidParameters("at least one process is required");
  }
  if (resources.empty()) {
    throw util::InvalidParameters("at least one resource is required");
  }
  if (params.max_iterations <= 0) {
    throw util::InvalidParameters("max_iterations must be greater than zero");
  }
  if (!(params.tolerance > 0.0)) {
    throw util::InvalidParameters("tolerance must be greater than zero");
  }
  if (params.weights.cost < 0.0 || params.weights.time < 0.0 || params.weights.efficiency < 0.0) {
    throw util::InvalidParameters("objective weights must not be negative");
  }
  if (std::abs(params.weights.Sum() - 1.0) > kWeightSumTolerance) {
    throw util::InvalidParameters("objective weights must sum to 1.0");
  }
  if (params.time_budget && params.time_budget->count() <= 0) {
    throw util::InvalidParameters("time budget must be positive");
  }
}

OptimizationResult Optimizer::Run(const std::vector<model::Process>& processes, const std::vector<model::Resource>& resources,
                                  const OptimizationParams& params) {
  Validate(processes, resources, params);

  const auto started_at = std::chrono::steady_clock::now();

  std::mt19937_64 rng(params.random_seed ? *params.random_seed : std::random_device{}());

  SearchContext context{processes, resources, params, rng, params.base_start.value_or(util::Now()), std::nullopt};
  if (params.time_budget) {
    context.deadline = started_at + *params.time_budget;
  }

  auto search  = SearchFactory::Create(params.algorithm);
  auto outcome = search->Run(context);

  OptimizationResult result;
  result.assignments         = std::move(outcome.assignments);
  result.objective_value     = outcome.objective;
  result.iterations          = outcome.iterations;
  result.converged           = outcome.converged;
  result.algorithm_requested = params.algorithm;
  result.algorithm_used      = outcome.algorithm_used;
  result.fell_back           = outcome.fell_back;
  result.metrics             = report::ComputeSolutionMetrics(result.assignments);
  result.elapsed             = std::chrono::steady_clock::now() - started_at;
  return result;
}

} // namespace planner::optimization
