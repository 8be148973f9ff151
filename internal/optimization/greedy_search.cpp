#include "greedy_search.hpp"

#include <algorithm>
#include <limits>
#include <utility>

#include "internal/allocation/greedy_allocator.hpp"
#include "internal/optimization/weighted_scoring_model.hpp"

namespace planner::optimization {

std::vector<const model::Process*> GreedySearch::OrderProcesses(const std::vector<model::Process>&  processes,
                                                                const std::vector<model::Resource>& resources,
                                                                const ObjectiveWeights&             weights) {
  double cheapest_rate = std::numeric_limits<double>::infinity();
  for (const auto& resource : resources) {
    if (resource.cost_per_hour() > 0.0) {
      cheapest_rate = std::min(cheapest_rate, resource.cost_per_hour());
    }
  }
  const bool has_paid_resource = cheapest_rate != std::numeric_limits<double>::infinity();

  std::vector<std::pair<const model::Process*, double>> keyed;
  keyed.reserve(processes.size());
  for (const auto& process : processes) {
    const double duration = process.estimated_hours();
    double       key      = model::PriorityValue(process.priority()) * weights.efficiency + (1.0 / duration) * weights.time;
    if (has_paid_resource) {
      key += (1.0 / (duration * cheapest_rate)) * weights.cost;
    }
    keyed.emplace_back(&process, key);
  }

  std::stable_sort(keyed.begin(), keyed.end(), [](const auto& a, const auto& b) { return a.second > b.second; });

  std::vector<const model::Process*> ordered;
  ordered.reserve(keyed.size());
  for (const auto& [process, key] : keyed) {
    ordered.push_back(process);
  }
  return ordered;
}

SearchOutcome GreedySearch::Run(const SearchContext& context) const {
  const auto& weights = context.params.weights;

  std::vector<const model::Resource*> resources;
  resources.reserve(context.resources.size());
  for (const auto& resource : context.resources) {
    resources.push_back(&resource);
  }

  WeightedScoringModel        scoring(weights);
  allocation::GreedyAllocator allocator(scoring, allocation::Timeline::kContinuousHours, context.base_start);

  auto run = allocator.Run(OrderProcesses(context.processes, context.resources, weights), resources);

  SearchOutcome outcome;
  outcome.assignments    = std::move(run.assignments);
  outcome.objective      = Objective(outcome.assignments, weights);
  outcome.iterations     = 1;
  outcome.converged      = true;
  outcome.algorithm_used = model::Algorithm::kGreedy;
  return outcome;
}

} // namespace planner::optimization
