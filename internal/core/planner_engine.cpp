#include "planner_engine.hpp"

#include <cstdint>
#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include "internal/allocation/constraint_filter.hpp"
#include "internal/allocation/greedy_allocator.hpp"
#include "internal/allocation/strategy_scoring_model.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/optimization/optimizer.hpp"
#include "internal/util/errors.hpp"

namespace planner::core {

namespace {

using observability::BoolField;
using observability::DoubleField;
using observability::IntField;
using observability::StringField;

std::int64_t Count(std::size_t n) {
  return static_cast<std::int64_t>(n);
}

template <typename Failure, typename Fn>
auto GuardRun(std::string_view operation, Fn&& fn) {
  observability::OperationSpan span(operation);
  try {
    return fn(span);
  } catch (const util::ValidationError& ex) {
    span.MarkRejected(ex.what());
    PLANNER_LOG_WARN("Request rejected", {StringField("operation", operation), StringField("error", ex.what())});
    throw;
  } catch (const std::exception& ex) {
    span.MarkFailed(ex.what());
    PLANNER_LOG_ERROR("Run failed", {StringField("operation", operation), StringField("error", ex.what())});
    std::throw_with_nested(Failure(std::string(operation) + " failed: " + ex.what()));
  }
}

} // namespace

PlannerEngine::PlannerEngine(EngineOptions options) : options_(std::move(options)) {
}

model::ConstraintSet PlannerEngine::WithDefaults(const std::optional<model::ConstraintSet>& restrictions) const {
  model::ConstraintSet constraints = restrictions.value_or(model::ConstraintSet{});
  if (!constraints.max_hours_per_resource) {
    constraints.max_hours_per_resource = options_.default_max_hours_per_resource;
  }
  if (!constraints.max_processes_per_resource) {
    constraints.max_processes_per_resource = options_.default_max_processes_per_resource;
  }
  return constraints;
}

capacity::CapacityReport PlannerEngine::ComputeCapacity(const capacity::PlanningWindow& window, const std::vector<model::Resource>& resources,
                                                        const std::vector<model::Process>&         processes,
                                                        const std::optional<model::ConstraintSet>& restrictions, util::TimePoint now) const {
  return GuardRun<util::AllocationFailed>("capacity", [&](observability::OperationSpan& span) {
    span.SetAttribute("resources", Count(resources.size()));
    span.SetAttribute("processes", Count(processes.size()));

    auto report = capacity::CapacityEstimator::Estimate(window, resources, processes, WithDefaults(restrictions), now);

    PLANNER_LOG_INFO("Capacity estimated", {IntField("working_days", report.working_days),
                                            IntField("possible_processes", report.possible_process_count),
                                            DoubleField("available_hours", report.total_available_hours),
                                            DoubleField("projected_efficiency", report.projected_efficiency)});
    return report;
  });
}

DistributionReport PlannerEngine::Distribute(const std::vector<model::Process>& processes, const std::vector<model::Resource>& resources,
                                             std::optional<model::Strategy>             strategy,
                                             const std::optional<model::ConstraintSet>& restrictions,
                                             std::optional<util::TimePoint>             base_start) const {
  return GuardRun<util::AllocationFailed>("distribute", [&](observability::OperationSpan& span) {
    const auto active = strategy.value_or(options_.default_strategy);
    span.SetAttribute("strategy", model::ToString(active));

    if (processes.empty()) {
      throw util::NoProcesses("at least one process is required to distribute");
    }
    if (resources.empty()) {
      throw util::NoResources("at least one resource is required to distribute");
    }

    const auto constraints = WithDefaults(restrictions);
    allocation::ConstraintFilter::ValidateRestrictions(constraints);
    allocation::ConstraintFilter::ValidateProcesses(processes);

    const auto start = base_start.value_or(util::Now());

    PLANNER_LOG_INFO("Distribution started", {StringField("strategy", model::ToString(active)), IntField("processes", Count(processes.size())),
                                              IntField("resources", Count(resources.size()))});

    const auto eligible = allocation::ConstraintFilter::FilterResources(resources, constraints);
    const auto ordered  = allocation::ConstraintFilter::OrderProcesses(processes, active, constraints, eligible);

    allocation::StrategyScoringModel scoring(active, constraints, start);
    allocation::GreedyAllocator      allocator(scoring, allocation::Timeline::kWorkingDays, start);
    auto                             run = allocator.Run(ordered, eligible);

    DistributionReport report;
    report.strategy           = active;
    report.assignments        = std::move(run.assignments);
    report.eligible_resources = eligible.size();
    report.unassigned.reserve(run.unassigned.size());
    for (const auto* process : run.unassigned) {
      report.unassigned.push_back(*process);
    }
    report.metrics         = report::ComputeDistributionMetrics(report.assignments, resources.size());
    report.recommendations = report::DistributionRecommendations(report.assignments, report.unassigned.size(), eligible.size(),
                                                                 report.metrics, options_.recommendations);

    span.SetAttribute("assigned", Count(report.assignments.size()));
    span.SetAttribute("unassigned", Count(report.unassigned.size()));
    PLANNER_LOG_INFO("Distribution completed", {IntField("assigned", Count(report.assignments.size())),
                                                IntField("unassigned", Count(report.unassigned.size())),
                                                DoubleField("total_cost", report.metrics.total_cost),
                                                DoubleField("efficiency", report.metrics.efficiency)});
    return report;
  });
}

optimization::OptimizationResult PlannerEngine::Optimize(const std::vector<model::Process>& processes, const std::vector<model::Resource>& resources,
                                                         const std::optional<optimization::OptimizationParams>& params) const {
  return GuardRun<util::OptimizationFailed>("optimize", [&](observability::OperationSpan& span) {
    const auto& effective = params ? *params : options_.optimization;
    span.SetAttribute("algorithm", model::ToString(effective.algorithm));

    PLANNER_LOG_INFO("Optimization started", {StringField("algorithm", model::ToString(effective.algorithm)),
                                              IntField("processes", Count(processes.size())), IntField("resources", Count(resources.size()))});

    auto result = optimization::Optimizer::Run(processes, resources, effective);

    if (result.fell_back) {
      PLANNER_LOG_WARN("Optimization fell back to greedy", {StringField("requested", model::ToString(result.algorithm_requested))});
    }

    span.SetAttribute("iterations", static_cast<std::int64_t>(result.iterations));
    span.SetAttribute("objective", result.objective_value);
    span.SetAttribute("fell_back", result.fell_back);
    PLANNER_LOG_INFO("Optimization completed", {StringField("algorithm", model::ToString(result.algorithm_used)),
                                                IntField("assigned", Count(result.assignments.size())),
                                                IntField("iterations", result.iterations), BoolField("converged", result.converged),
                                                DoubleField("objective", result.objective_value)});
    return result;
  });
}

} // namespace planner::core
