#include "search_factory.hpp"

#include <string>

#include "internal/optimization/annealing_search.hpp"
#include "internal/optimization/branch_and_bound_search.hpp"
#include "internal/optimization/genetic_search.hpp"
#include "internal/optimization/greedy_search.hpp"
#include "internal/optimization/linear_search.hpp"
#include "internal/util/errors.hpp"

namespace planner::optimization {

std::unique_ptr<SearchAlgorithm> SearchFactory::Create(model::Algorithm algorithm) {
  switch (algorithm) {
    case model::Algorithm::kGreedy:
      return std::make_unique<GreedySearch>();
    case model::Algorithm::kGenetic:
      return std::make_unique<GeneticSearch>();
    case model::Algorithm::kSimulatedAnnealing:
      return std::make_unique<AnnealingSearch>();
    case model::Algorithm::kLinear:
      return std::make_unique<LinearSearch>();
    case model::Algorithm::kBranchAndBound:
      return std::make_unique<BranchAndBoundSearch>();
  }
  throw util::InvalidParameters("unsupported optimization algorithm: " + std::to_string(static_cast<int>(algorithm)));
}

} // namespace planner::optimization
