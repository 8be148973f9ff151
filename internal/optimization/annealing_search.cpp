#include "annealing_search.hpp"

#include <cmath>
#include <string>
#include <unordered_map>
#include <utility>

#include "internal/allocation/scoring_model.hpp"
#include "internal/allocation/timeline.hpp"
#include "internal/optimization/greedy_search.hpp"

namespace planner::optimization {

namespace {

using Solution = std::vector<model::Assignment>;

class NeighborGenerator {
 public:
  explicit NeighborGenerator(const SearchContext& context) : context_(context) {
    for (const auto& process : context.processes) {
      by_id_.emplace(process.id(), &process);
    }
  }

  Solution Next(const Solution& current) const {
    Solution next = current;
    if (next.empty()) {
      return next;
    }

    std::uniform_int_distribution<std::size_t> pick_assignment(0, next.size() - 1);
    std::uniform_int_distribution<std::size_t> pick_resource(0, context_.resources.size() - 1);

    const auto  index    = pick_assignment(context_.rng);
    const auto& resource = context_.resources[pick_resource(context_.rng)];

    auto it = by_id_.find(next[index].process_id);
    if (it == by_id_.end()) {
      return next;
    }
    const auto& process = *it->second;

    if (!Fits(next, index, process, resource)) {
      return next;
    }

    const auto interval =
        allocation::ProjectInterval(allocation::Timeline::kContinuousHours, context_.base_start, 0.0, process.estimated_hours(), 0.0);

    auto& moved          = next[index];
    moved.resource_id    = resource.id();
    moved.start_time     = interval.start;
    moved.end_time       = interval.end;
    moved.estimated_cost = resource.CostForHours(process.estimated_hours());
    return next;
  }

 private:
  // Hours already on the resource (ignoring the moved assignment) plus the
  // process must stay within the resource's spare capacity.
  static bool Fits(const Solution& solution, std::size_t index, const model::Process& process, const model::Resource& resource) {
    if (!resource.CanAssign(process.estimated_hours()) || !allocation::IsCapabilityCompatible(process, resource)) {
      return false;
    }

    double hours = 0.0;
    for (std::size_t i = 0; i < solution.size(); ++i) {
      if (i != index && solution[i].resource_id == resource.id()) {
        hours += solution[i].hours_assigned;
      }
    }
    return hours + process.estimated_hours() <= resource.AvailableCapacity();
  }

  const SearchContext&                                    context_;
  std::unordered_map<std::string, const model::Process*> by_id_;
};

} // namespace

SearchOutcome AnnealingSearch::Run(const SearchContext& context) const {
  const auto& weights = context.params.weights;

  auto baseline = GreedySearch().Run(context);

  Solution current       = std::move(baseline.assignments);
  double   current_value = Objective(current, weights);
  Solution best          = current;
  double   best_value    = current_value;

  NeighborGenerator                      neighbors(context);
  std::uniform_real_distribution<double> unit(0.0, 1.0);

  double temperature = kInitialTemperature;
  int    iterations  = 0;

  for (int iteration = 0; iteration < context.params.max_iterations; ++iteration) {
    if (context.DeadlineExpired()) {
      break;
    }
    ++iterations;

    auto         candidate       = neighbors.Next(current);
    const double candidate_value = Objective(candidate, weights);

    if (candidate_value < current_value) {
      current       = std::move(candidate);
      current_value = candidate_value;
      if (current_value < best_value) {
        best       = current;
        best_value = current_value;
      }
    } else {
      const double delta = candidate_value - current_value;
      if (unit(context.rng) < std::exp(-delta / temperature)) {
        current       = std::move(candidate);
        current_value = candidate_value;
      }
    }

    temperature *= kCoolingFactor;
    if (temperature < kFinalTemperature) {
      break;
    }
  }

  SearchOutcome outcome;
  outcome.assignments    = std::move(best);
  outcome.objective      = best_value;
  outcome.iterations     = iterations;
  outcome.converged      = temperature < kFinalTemperature;
  outcome.algorithm_used = model::Algorithm::kSimulatedAnnealing;
  return outcome;
}

} // namespace planner::optimization
