#include <iostream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

using planner::model::Algorithm;
using planner::model::Priority;
using planner::model::Process;
using planner::model::Resource;
using planner::model::ResourceType;

int main(int argc, char** argv) {
  planner::runtime::config::RuntimeConfig config;

  try {
    if (argc > 1) {
      config = planner::config::ConfigLoader::LoadFromYaml(argv[1]);
    }

    planner::observability::InitializeTracing(config);
    planner::observability::InitializeLogging(config);

    auto runtime = planner::factory::BuildRuntime(config);

    std::vector<Resource> resources{Resource("Team A", ResourceType::kHuman, 40.0, 30.0),
                                    Resource("Team B", ResourceType::kHuman, 40.0, 45.0),
                                    Resource("Contractor", ResourceType::kFinancial, 24.0, 80.0)};

    std::vector<Process> processes;
    for (int i = 0; i < 10; ++i) {
      processes.emplace_back("Ticket " + std::to_string(i + 1), 2.0 + (i % 4) * 1.5, i % 3 == 0 ? Priority::kHigh : Priority::kMedium);
    }

    // Compare every algorithm against the engine's configured parameters.
    for (auto algorithm :
         {Algorithm::kGreedy, Algorithm::kSimulatedAnnealing, Algorithm::kGenetic, Algorithm::kLinear, Algorithm::kBranchAndBound}) {
      auto params      = runtime.engine->options().optimization;
      params.algorithm = algorithm;
      if (!params.random_seed) {
        params.random_seed = 2024;
      }

      auto result = runtime.engine->Optimize(processes, resources, params);

      std::cout << planner::model::ToString(algorithm) << " (ran " << planner::model::ToString(result.algorithm_used)
                << (result.fell_back ? ", fell back" : "") << "): objective " << result.objective_value << ", "
                << result.assignments.size() << " assigned, cost $" << result.metrics.total_cost << ", makespan "
                << result.metrics.makespan_hours << "h, " << result.iterations << " iterations, " << result.elapsed.count() * 1000.0
                << " ms\n";
    }

    planner::observability::ShutdownLogging();
    planner::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    PLANNER_LOG_ERROR("Example failed", {planner::observability::StringField("error", e.what())});
    std::cerr << "optimize_example: " << e.what() << '\n';
    planner::observability::ShutdownLogging();
    planner::observability::ShutdownTracing();
    return 1;
  }

  return 0;
}
