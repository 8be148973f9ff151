#include <iostream>
#include <string>
#include <vector>

#include "internal/allocation/commit.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"

using planner::model::ExperienceLevel;
using planner::model::Priority;
using planner::model::Process;
using planner::model::Resource;
using planner::model::ResourceType;

int main(int argc, char** argv) {
  // Optional YAML config; built-in defaults otherwise.
  planner::runtime::config::RuntimeConfig config;

  try {
    if (argc > 1) {
      config = planner::config::ConfigLoader::LoadFromYaml(argv[1]);
    }

    planner::observability::InitializeTracing(config);
    planner::observability::InitializeLogging(config);

    auto runtime = planner::factory::BuildRuntime(config);

    std::vector<Resource> resources{Resource("Ana", ResourceType::kHuman, 40.0, 35.0, {"welding", "assembly"}),
                                    Resource("Luis", ResourceType::kHuman, 32.0, 28.0, {"assembly"}),
                                    Resource("CNC-01", ResourceType::kMaterial, 60.0, 50.0, {"machining"})};
    resources[0].set_experience(ExperienceLevel::kSenior);

    std::vector<Process> processes{Process("Frame welding", 12.0, Priority::kHigh, {"welding"}),
                                   Process("Shaft machining", 16.0, Priority::kMedium, {"machining"}),
                                   Process("Final assembly", 10.0, Priority::kCritical, {"assembly"}),
                                   Process("Bracket machining", 6.0, Priority::kLow, {"machining"}),
                                   Process("Fixture repair", 20.0, Priority::kMedium, {"welding"})};

    const auto start    = planner::util::StartOfDay(planner::util::Now());
    auto       capacity = runtime.engine->ComputeCapacity({start, planner::util::AddDays(start, 14)}, resources, processes);

    std::cout << "Capacity over " << capacity.working_days << " working days: " << capacity.possible_process_count << " processes, "
              << capacity.total_available_hours << " hours available\n";
    for (const auto& line : capacity.recommendations) {
      std::cout << "  - " << line << '\n';
    }

    auto report = runtime.engine->Distribute(processes, resources);

    std::cout << "Strategy " << planner::model::ToString(report.strategy) << ": " << report.assignments.size() << " assigned, "
              << report.unassigned.size() << " unassigned\n";
    for (const auto& assignment : report.assignments) {
      std::cout << "  " << assignment.process_id << " -> " << assignment.resource_id << "  " << assignment.hours_assigned << "h  $"
                << assignment.estimated_cost << "  until " << planner::util::FormatTimestamp(assignment.end_time) << '\n';
    }
    std::cout << "Total cost $" << report.metrics.total_cost << ", efficiency " << report.metrics.efficiency << "%\n";
    for (const auto& line : report.recommendations) {
      std::cout << "  - " << line << '\n';
    }

    planner::allocation::CommitAssignments(report.assignments, resources);
    for (const auto& resource : resources) {
      std::cout << resource.name() << ": " << resource.UtilizationPercent() << "% utilized\n";
    }

    planner::observability::ShutdownLogging();
    planner::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    PLANNER_LOG_ERROR("Example failed", {planner::observability::StringField("error", e.what())});
    std::cerr << "distribute_example: " << e.what() << '\n';
    planner::observability::ShutdownLogging();
    planner::observability::ShutdownTracing();
    return 1;
  }

  return 0;
}
