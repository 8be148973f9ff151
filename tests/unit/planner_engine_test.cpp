#include "internal/core/planner_engine.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/allocation/commit.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace {

using planner::core::EngineOptions;
using planner::core::PlannerEngine;
using planner::model::Algorithm;
using planner::model::ConstraintSet;
using planner::model::Process;
using planner::model::Resource;
using planner::model::ResourceType;
using planner::model::Strategy;
using planner::util::AddDays;
using planner::util::TimePoint;

TimePoint Monday() {
  return TimePoint{} + std::chrono::hours(24 * 21921);
}

bool Mentions(const std::vector<std::string>& lines, const std::string& needle) {
  return std::any_of(lines.begin(), lines.end(), [&](const std::string& line) { return line.find(needle) != std::string::npos; });
}

void TestDistributeReportsMetrics() {
  PlannerEngine         engine;
  std::vector<Process>  processes{Process("inspect", 8.0)};
  std::vector<Resource> resources{Resource("inspector", ResourceType::kHuman, 40.0, 10.0)};

  auto report = engine.Distribute(processes, resources, std::nullopt, std::nullopt, Monday());

  assert(report.strategy == Strategy::kBalanced);
  assert(report.assignments.size() == 1);
  assert(report.unassigned.empty());
  assert(report.eligible_resources == 1);
  assert(report.assignments[0].end_time == AddDays(Monday(), 2));

  assert(report.metrics.total_cost == 80.0);
  assert(report.metrics.total_hours == 48.0);
  assert(report.metrics.work_hours == 8.0);
  assert(std::abs(report.metrics.efficiency - 100.0 / 6.0) < 1e-9);
  assert(report.metrics.resource_utilization == 100.0);
  assert(report.metrics.average_hourly_cost == 10.0);
  assert(Mentions(report.recommendations, "Efficiency is low"));

  // Caller data is never modified.
  assert(resources[0].current_capacity() == 0.0);
  assert(processes[0].status() == planner::model::ProcessStatus::kPending);
}

void TestUnassignedAndIdleResourcesAreReported() {
  PlannerEngine         engine;
  std::vector<Process>  processes{Process("etl", 6.0, planner::model::Priority::kMedium, {"python"}),
                                  Process("report", 6.0, planner::model::Priority::kMedium, {"python"})};
  std::vector<Resource> resources{Resource("py-dev", ResourceType::kHuman, 10.0, 20.0, {"python"}),
                                  Resource("jvm-dev", ResourceType::kHuman, 40.0, 20.0, {"java"})};

  auto report = engine.Distribute(processes, resources, Strategy::kCostMinimum, std::nullopt, Monday());

  assert(report.assignments.size() == 1);
  assert(report.unassigned.size() == 1);
  assert(report.unassigned[0].id() == processes[1].id());
  assert(report.metrics.resource_utilization == 50.0);
  assert(Mentions(report.recommendations, "1 processes could not be assigned"));
  assert(Mentions(report.recommendations, "1 eligible resources were left unused"));
}

void TestValidationErrorsSurfaceUnchanged() {
  PlannerEngine         engine;
  std::vector<Process>  processes{Process("inspect", 8.0)};
  std::vector<Resource> resources{Resource("inspector", ResourceType::kHuman, 40.0)};

  bool threw = false;
  try {
    (void)engine.Distribute({}, resources);
  } catch (const planner::util::NoProcesses&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)engine.Distribute(processes, {});
  } catch (const planner::util::NoResources&) {
    threw = true;
  }
  assert(threw);

  ConstraintSet bad;
  bad.max_processes_per_resource = -2;
  threw                          = false;
  try {
    (void)engine.Distribute(processes, resources, std::nullopt, bad);
  } catch (const planner::util::InvalidRestriction&) {
    threw = true;
  }
  assert(threw);

  processes[0].Start();
  threw = false;
  try {
    (void)engine.Distribute(processes, resources);
  } catch (const planner::util::InvalidProcessState&) {
    threw = true;
  }
  assert(threw);

  planner::optimization::OptimizationParams params;
  params.weights = {0.5, 0.5, 0.5};
  threw          = false;
  try {
    (void)engine.Optimize({Process("x", 1.0)}, resources, params);
  } catch (const planner::util::InvalidParameters&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)engine.ComputeCapacity({Monday(), Monday()}, resources, {}, std::nullopt, Monday());
  } catch (const planner::util::InvalidWindow&) {
    threw = true;
  }
  assert(threw);
}

void TestEngineDefaultsApplyWhenUnset() {
  EngineOptions options;
  options.default_strategy               = Strategy::kCostMinimum;
  options.default_max_hours_per_resource = 5.0;
  PlannerEngine engine(options);

  std::vector<Process>  processes{Process("overhaul", 8.0)};
  std::vector<Resource> resources{Resource("mechanic", ResourceType::kHuman, 40.0, 30.0)};

  auto capped = engine.Distribute(processes, resources, std::nullopt, std::nullopt, Monday());
  assert(capped.strategy == Strategy::kCostMinimum);
  assert(capped.assignments.empty());

  ConstraintSet wider;
  wider.max_hours_per_resource = 10.0;
  auto relaxed                 = engine.Distribute(processes, resources, Strategy::kBalanced, wider, Monday());
  assert(relaxed.strategy == Strategy::kBalanced);
  assert(relaxed.assignments.size() == 1);

  auto capacity = engine.ComputeCapacity({Monday(), AddDays(Monday(), 7)}, resources, processes, std::nullopt, Monday());
  assert(capacity.total_available_hours == 5.0);
}

void TestOptimizeUsesEngineParameters() {
  EngineOptions options;
  options.optimization.algorithm      = Algorithm::kGenetic;
  options.optimization.max_iterations = 3;
  options.optimization.random_seed    = 11;
  options.optimization.base_start     = Monday();
  PlannerEngine engine(options);

  std::vector<Process>  processes{Process("cut", 4.0), Process("weld", 6.0)};
  std::vector<Resource> resources{Resource("crew", ResourceType::kHuman, 40.0, 10.0)};

  auto result = engine.Optimize(processes, resources);
  assert(result.algorithm_requested == Algorithm::kGenetic);
  assert(result.iterations == 3);
  assert(result.assignments.size() == 2);
  assert(result.metrics.assignment_count == 2);
}

void TestCommitRecordsAuditTrail() {
  PlannerEngine         engine;
  std::vector<Process>  processes{Process("a", 4.0), Process("b", 6.0)};
  std::vector<Resource> resources{Resource("crew", ResourceType::kHuman, 40.0, 10.0)};

  auto report = engine.Distribute(processes, resources, std::nullopt, std::nullopt, Monday());
  planner::allocation::CommitAssignments(report.assignments, resources, Monday());

  assert(resources[0].current_capacity() == 10.0);
  assert(resources[0].assigned_processes().size() == 2);
  assert(resources[0].history().size() == 2);
  assert(resources[0].history()[1].before == 4.0);
  assert(resources[0].history()[1].after == 10.0);

  std::vector<Resource> strangers{Resource("other", ResourceType::kHuman, 40.0)};
  bool                  threw = false;
  try {
    planner::allocation::CommitAssignments(report.assignments, strangers, Monday());
  } catch (const planner::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  planner::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("warn");
  planner::observability::InitializeLogging(config);

  TestDistributeReportsMetrics();
  TestUnassignedAndIdleResourcesAreReported();
  TestValidationErrorsSurfaceUnchanged();
  TestEngineDefaultsApplyWhenUnset();
  TestOptimizeUsesEngineParameters();
  TestCommitRecordsAuditTrail();

  planner::observability::ShutdownLogging();
  std::cout << "resource_planner_unit_planner_engine: pass\n";
  return 0;
}
