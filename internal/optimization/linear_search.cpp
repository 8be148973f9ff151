#include "linear_search.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#if PLANNER_HAVE_ORTOOLS
#include "ortools/linear_solver/linear_solver.h"
#endif

#include "internal/allocation/scoring_model.hpp"
#include "internal/allocation/timeline.hpp"
#include "internal/observability/logging.hpp"
#include "internal/optimization/greedy_search.hpp"
#include "internal/optimization/weighted_scoring_model.hpp"

namespace planner::optimization {

#if PLANNER_HAVE_ORTOOLS

std::optional<SearchOutcome> LinearSearch::Solve(const SearchContext& context) {
  namespace ort = operations_research;

  const auto& processes = context.processes;
  const auto& resources = context.resources;
  const auto& weights   = context.params.weights;

  std::unique_ptr<ort::MPSolver> solver(ort::MPSolver::CreateSolver("GLOP"));
  if (!solver) {
    PLANNER_LOG_WARN("GLOP solver is unavailable");
    return std::nullopt;
  }

  const double infinity = solver->infinity();

  // Pairs the allocator could never use are pinned to 0.
  std::vector<std::vector<ort::MPVariable*>> cells(processes.size(), std::vector<ort::MPVariable*>(resources.size(), nullptr));
  for (std::size_t i = 0; i < processes.size(); ++i) {
    for (std::size_t j = 0; j < resources.size(); ++j) {
      const bool usable = resources[j].CanAssign(processes[i].estimated_hours()) &&
                          allocation::IsCapabilityCompatible(processes[i], resources[j]);
      cells[i][j] = solver->MakeNumVar(0.0, usable ? 1.0 : 0.0, "x_" + std::to_string(i) + "_" + std::to_string(j));
    }
  }

  for (std::size_t i = 0; i < processes.size(); ++i) {
    auto* row = solver->MakeRowConstraint(1.0, 1.0);
    for (std::size_t j = 0; j < resources.size(); ++j) {
      row->SetCoefficient(cells[i][j], 1.0);
    }
  }

  for (std::size_t j = 0; j < resources.size(); ++j) {
    auto* column = solver->MakeRowConstraint(-infinity, resources[j].AvailableCapacity());
    for (std::size_t i = 0; i < processes.size(); ++i) {
      column->SetCoefficient(cells[i][j], processes[i].estimated_hours());
    }
  }

  auto* objective = solver->MutableObjective();
  for (std::size_t i = 0; i < processes.size(); ++i) {
    for (std::size_t j = 0; j < resources.size(); ++j) {
      objective->SetCoefficient(cells[i][j], WeightedScoringModel::PairCost(processes[i], resources[j], weights));
    }
  }
  objective->SetMinimization();

  const auto status = solver->Solve();
  if (status != ort::MPSolver::OPTIMAL) {
    PLANNER_LOG_WARN("linear relaxation did not reach an optimal solution", {observability::IntField("status", static_cast<int>(status))});
    return std::nullopt;
  }

  SearchOutcome outcome;
  for (std::size_t i = 0; i < processes.size(); ++i) {
    for (std::size_t j = 0; j < resources.size(); ++j) {
      if (cells[i][j]->solution_value() <= kAssignmentThreshold) {
        continue;
      }

      const auto& process  = processes[i];
      const auto& resource = resources[j];
      const auto  interval = allocation::ProjectInterval(allocation::Timeline::kContinuousHours, context.base_start, 0.0,
                                                         process.estimated_hours(), resource.HoursPerDay());

      model::Assignment assignment;
      assignment.process_id     = process.id();
      assignment.resource_id    = resource.id();
      assignment.hours_assigned = process.estimated_hours();
      assignment.start_time     = interval.start;
      assignment.end_time       = interval.end;
      assignment.priority       = model::PriorityValue(process.priority());
      assignment.estimated_cost = resource.CostForHours(process.estimated_hours());
      outcome.assignments.push_back(std::move(assignment));
      break;
    }
  }

  // Reported on the thresholded assignments, comparable with the other searches.
  outcome.objective      = Objective(outcome.assignments, weights);
  outcome.iterations     = static_cast<int>(solver->iterations());
  outcome.converged      = true;
  outcome.algorithm_used = model::Algorithm::kLinear;
  return outcome;
}

#else

std::optional<SearchOutcome> LinearSearch::Solve(const SearchContext& /*context*/) {
  PLANNER_LOG_WARN("built without OR-tools, linear relaxation is unavailable");
  return std::nullopt;
}

#endif

SearchOutcome LinearSearch::Run(const SearchContext& context) const {
  if (auto solved = Solve(context)) {
    return std::move(*solved);
  }

  PLANNER_LOG_WARN("linear optimization failed, using greedy",
                   {observability::IntField("processes", static_cast<std::int64_t>(context.processes.size())),
                    observability::IntField("resources", static_cast<std::int64_t>(context.resources.size()))});

  auto outcome      = GreedySearch().Run(context);
  outcome.fell_back = true;
  return outcome;
}

} // namespace planner::optimization
