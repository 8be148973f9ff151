#include "factory.hpp"

#include <chrono>
#include <cmath>
#include <memory>
#include <string>

#include "internal/model/types.hpp"
#include "internal/optimization/optimizer.hpp"
#include "internal/util/errors.hpp"

namespace planner::factory {

namespace {

model::Strategy StrategyFromConfig(const std::string& name) {
  if (name.empty()) {
    return model::Strategy::kBalanced;
  }
  if (auto strategy = model::ParseStrategy(name)) {
    return *strategy;
  }
  throw util::InvalidParameters("unknown allocation strategy: " + name);
}

model::Algorithm AlgorithmFromConfig(const std::string& name) {
  if (name.empty()) {
    return model::Algorithm::kGreedy;
  }
  if (auto algorithm = model::ParseAlgorithm(name)) {
    return *algorithm;
  }
  throw util::InvalidParameters("unknown optimization algorithm: " + name);
}

void ApplyAllocation(const planner::runtime::config::AllocationConfig& cfg, core::EngineOptions* options) {
  options->default_strategy = StrategyFromConfig(cfg.default_strategy());

  if (cfg.default_max_hours_per_resource() < 0.0) {
    throw util::InvalidParameters("allocation.default_max_hours_per_resource must not be negative");
  }
  if (cfg.default_max_hours_per_resource() > 0.0) {
    options->default_max_hours_per_resource = cfg.default_max_hours_per_resource();
  }

  if (cfg.default_max_processes_per_resource() < 0) {
    throw util::InvalidParameters("allocation.default_max_processes_per_resource must not be negative");
  }
  if (cfg.default_max_processes_per_resource() > 0) {
    options->default_max_processes_per_resource = cfg.default_max_processes_per_resource();
  }
}

void ApplyOptimization(const planner::runtime::config::OptimizationConfig& cfg, optimization::OptimizationParams* params) {
  params->algorithm = AlgorithmFromConfig(cfg.algorithm());

  if (cfg.max_iterations() < 0) {
    throw util::InvalidParameters("optimization.max_iterations must not be negative");
  }
  if (cfg.max_iterations() > 0) {
    params->max_iterations = cfg.max_iterations();
  }

  if (cfg.tolerance() < 0.0) {
    throw util::InvalidParameters("optimization.tolerance must not be negative");
  }
  if (cfg.tolerance() > 0.0) {
    params->tolerance = cfg.tolerance();
  }

  // All three weights zero means "not configured".
  const bool has_weights = cfg.weight_cost() != 0.0 || cfg.weight_time() != 0.0 || cfg.weight_efficiency() != 0.0;
  if (has_weights) {
    params->weights = {cfg.weight_cost(), cfg.weight_time(), cfg.weight_efficiency()};
    if (std::abs(params->weights.Sum() - 1.0) > optimization::Optimizer::kWeightSumTolerance) {
      throw util::InvalidParameters("optimization weights must sum to 1.0");
    }
  }

  if (cfg.random_seed() != 0) {
    params->random_seed = cfg.random_seed();
  }
  if (cfg.time_budget_ms() != 0) {
    params->time_budget = std::chrono::milliseconds(cfg.time_budget_ms());
  }
}

void ApplyRecommendations(const planner::runtime::config::RecommendationConfig& cfg, report::RecommendationThresholds* thresholds) {
  if (cfg.high_average_cost_threshold() > 0.0) {
    thresholds->high_average_cost = cfg.high_average_cost_threshold();
  }
  if (cfg.low_efficiency_percent() > 0.0) {
    thresholds->low_efficiency_percent = cfg.low_efficiency_percent();
  }
  if (cfg.high_efficiency_percent() > 0.0) {
    thresholds->high_efficiency_percent = cfg.high_efficiency_percent();
  }
}

} // namespace

core::EngineOptions EngineOptionsFromConfig(const planner::runtime::config::RuntimeConfig& config) {
  core::EngineOptions options;
  ApplyAllocation(config.allocation(), &options);
  ApplyOptimization(config.optimization(), &options.optimization);
  ApplyRecommendations(config.recommendations(), &options.recommendations);
  return options;
}

Runtime BuildRuntime(const planner::runtime::config::RuntimeConfig& config) {
  Runtime runtime;
  runtime.engine = std::make_shared<core::PlannerEngine>(EngineOptionsFromConfig(config));
  return runtime;
}

} // namespace planner::factory
