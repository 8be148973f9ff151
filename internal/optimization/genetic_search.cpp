#include "genetic_search.hpp"

#include <cmath>
#include <limits>
#include <numeric>
#include <utility>

#include "internal/allocation/occupancy_ledger.hpp"
#include "internal/allocation/scoring_model.hpp"
#include "internal/allocation/timeline.hpp"

namespace planner::optimization {

namespace {

using Chromosome = GeneticSearch::Chromosome;
using Population = std::vector<Chromosome>;

Population InitialPopulation(const SearchContext& context) {
  std::uniform_int_distribution<std::size_t> gene(0, context.resources.size() - 1);

  Population population(GeneticSearch::kPopulationSize);
  for (auto& individual : population) {
    individual.resize(context.processes.size());
    for (auto& g : individual) {
      g = gene(context.rng);
    }
  }
  return population;
}

// Samples kTournamentSize distinct individuals; the lowest fitness wins.
const Chromosome& Tournament(const Population& population, const std::vector<double>& fitness, std::mt19937_64& rng) {
  std::vector<std::size_t> indices(population.size());
  std::iota(indices.begin(), indices.end(), 0);

  for (int i = 0; i < GeneticSearch::kTournamentSize; ++i) {
    std::uniform_int_distribution<std::size_t> pick(static_cast<std::size_t>(i), indices.size() - 1);
    std::swap(indices[static_cast<std::size_t>(i)], indices[pick(rng)]);
  }

  std::size_t winner = indices[0];
  for (int i = 1; i < GeneticSearch::kTournamentSize; ++i) {
    const auto candidate = indices[static_cast<std::size_t>(i)];
    if (fitness[candidate] < fitness[winner]) {
      winner = candidate;
    }
  }
  return population[winner];
}

std::pair<Chromosome, Chromosome> UniformCrossover(const Chromosome& a, const Chromosome& b, std::mt19937_64& rng) {
  std::uniform_real_distribution<double> coin(0.0, 1.0);

  Chromosome first(a.size());
  Chromosome second(a.size());
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (coin(rng) < 0.5) {
      first[i]  = a[i];
      second[i] = b[i];
    } else {
      first[i]  = b[i];
      second[i] = a[i];
    }
  }
  return {std::move(first), std::move(second)};
}

void Mutate(Chromosome& individual, std::size_t resource_count, std::mt19937_64& rng) {
  std::uniform_real_distribution<double>     unit(0.0, 1.0);
  std::uniform_int_distribution<std::size_t> gene(0, resource_count - 1);

  for (auto& g : individual) {
    if (unit(rng) < GeneticSearch::kMutationRate) {
      g = gene(rng);
    }
  }
}

} // namespace

std::vector<model::Assignment> GeneticSearch::Decode(const Chromosome& genes, const SearchContext& context) {
  std::vector<model::Assignment> assignments;
  allocation::OccupancyLedger    ledger;

  for (std::size_t i = 0; i < genes.size(); ++i) {
    const auto& process  = context.processes[i];
    const auto& resource = context.resources[genes[i]];

    if (!allocation::HasLedgerHeadroom(process, resource, ledger) || !allocation::IsCapabilityCompatible(process, resource)) {
      continue;
    }

    const double occupied = ledger.Hours(resource.id());
    const auto   interval = allocation::ProjectInterval(allocation::Timeline::kContinuousHours, context.base_start, occupied,
                                                        process.estimated_hours(), resource.HoursPerDay());

    model::Assignment assignment;
    assignment.process_id     = process.id();
    assignment.resource_id    = resource.id();
    assignment.hours_assigned = process.estimated_hours();
    assignment.start_time     = interval.start;
    assignment.end_time       = interval.end;
    assignment.priority       = model::PriorityValue(process.priority());
    assignment.estimated_cost = resource.CostForHours(process.estimated_hours());
    assignments.push_back(std::move(assignment));

    ledger.Commit(resource.id(), process.estimated_hours());
  }

  return assignments;
}

SearchOutcome GeneticSearch::Run(const SearchContext& context) const {
  const auto& params  = context.params;
  const auto& weights = params.weights;

  auto population = InitialPopulation(context);

  std::vector<model::Assignment> best;
  double                         best_value  = std::numeric_limits<double>::infinity();
  int                            generations = 0;

  std::uniform_real_distribution<double> unit(0.0, 1.0);
  std::vector<double>                    fitness(population.size());

  for (int generation = 0; generation < params.max_iterations; ++generation) {
    if (context.DeadlineExpired()) {
      break;
    }
    ++generations;

    for (std::size_t i = 0; i < population.size(); ++i) {
      auto decoded = Decode(population[i], context);
      fitness[i]   = Objective(decoded, weights);
      if (fitness[i] < best_value) {
        best_value = fitness[i];
        best       = std::move(decoded);
      }
    }

    Population selected;
    selected.reserve(population.size());
    for (std::size_t i = 0; i < population.size(); ++i) {
      selected.push_back(Tournament(population, fitness, context.rng));
    }

    Population next;
    next.reserve(selected.size() + 1);
    for (std::size_t i = 0; i < selected.size(); i += 2) {
      const auto& first  = selected[i];
      const auto& second = i + 1 < selected.size() ? selected[i + 1] : selected[0];

      if (unit(context.rng) < kCrossoverRate) {
        auto [a, b] = UniformCrossover(first, second, context.rng);
        next.push_back(std::move(a));
        next.push_back(std::move(b));
      } else {
        next.push_back(first);
        next.push_back(second);
      }
    }

    for (auto& individual : next) {
      Mutate(individual, context.resources.size(), context.rng);
    }
    population = std::move(next);
    fitness.resize(population.size());

    if (generation > kMinGenerations && std::abs(best_value) < params.tolerance) {
      break;
    }
  }

  SearchOutcome outcome;
  outcome.assignments    = std::move(best);
  outcome.objective      = best_value;
  outcome.iterations     = generations;
  outcome.converged      = std::abs(best_value) < params.tolerance;
  outcome.algorithm_used = model::Algorithm::kGenetic;
  return outcome;
}

} // namespace planner::optimization
