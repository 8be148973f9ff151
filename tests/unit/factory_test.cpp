#include "internal/factory.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/util/errors.hpp"

namespace {

using planner::config::ConfigLoader;
using planner::factory::BuildRuntime;
using planner::factory::EngineOptionsFromConfig;
using planner::model::Algorithm;
using planner::model::Strategy;

bool Rejected(const std::string& yaml) {
  try {
    (void)EngineOptionsFromConfig(ConfigLoader::LoadFromYamlString(yaml));
  } catch (const planner::util::InvalidParameters&) {
    return true;
  }
  return false;
}

void TestEmptyConfigKeepsDefaults() {
  auto options = EngineOptionsFromConfig(planner::runtime::config::RuntimeConfig{});

  assert(options.default_strategy == Strategy::kBalanced);
  assert(!options.default_max_hours_per_resource);
  assert(!options.default_max_processes_per_resource);
  assert(options.optimization.algorithm == Algorithm::kGreedy);
  assert(options.optimization.max_iterations == 1000);
  assert(options.optimization.tolerance == 1e-6);
  assert(options.optimization.weights.cost == 0.4);
  assert(!options.optimization.random_seed);
  assert(!options.optimization.time_budget);
  assert(options.recommendations.high_average_cost == 1000.0);
}

void TestConfiguredValuesAreApplied() {
  auto options = EngineOptionsFromConfig(ConfigLoader::LoadFromYamlString(R"(allocation:
  default_strategy: priority
  default_max_hours_per_resource: 24
  default_max_processes_per_resource: 3
optimization:
  algorithm: genetic
  max_iterations: 40
  weight_cost: 0.2
  weight_time: 0.2
  weight_efficiency: 0.6
  random_seed: 99
  time_budget_ms: 250
recommendations:
  low_efficiency_percent: 40
)"));

  assert(options.default_strategy == Strategy::kPriority);
  assert(options.default_max_hours_per_resource == 24.0);
  assert(options.default_max_processes_per_resource == 3);
  assert(options.optimization.algorithm == Algorithm::kGenetic);
  assert(options.optimization.max_iterations == 40);
  assert(options.optimization.weights.efficiency == 0.6);
  assert(options.optimization.random_seed == 99u);
  assert(options.optimization.time_budget == std::chrono::milliseconds(250));
  assert(options.recommendations.low_efficiency_percent == 40.0);
  assert(options.recommendations.high_efficiency_percent == 90.0);
}

void TestInvalidValuesAreRejected() {
  assert(Rejected("allocation:\n  default_strategy: fastest\n"));
  assert(Rejected("optimization:\n  algorithm: quantum\n"));
  assert(Rejected("allocation:\n  default_max_hours_per_resource: -1\n"));
  assert(Rejected("optimization:\n  max_iterations: -5\n"));
  assert(Rejected("optimization:\n  weight_cost: 0.5\n  weight_time: 0.5\n  weight_efficiency: 0.5\n"));
}

void TestRuntimeOwnsConfiguredEngine() {
  auto runtime = BuildRuntime(ConfigLoader::LoadFromYamlString("allocation:\n  default_strategy: time_minimum\n"));
  assert(runtime.engine);
  assert(runtime.engine->options().default_strategy == Strategy::kTimeMinimum);
}

} // namespace

int main() {
  TestEmptyConfigKeepsDefaults();
  TestConfiguredValuesAreApplied();
  TestInvalidValuesAreRejected();
  TestRuntimeOwnsConfiguredEngine();

  std::cout << "resource_planner_unit_factory: pass\n";
  return 0;
}
