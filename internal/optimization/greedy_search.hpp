#pragma once

#include <vector>

#include "internal/optimization/search_algorithm.hpp"

namespace planner::optimization {

/*
  One deterministic pass of the greedy allocator with the weighted pair
  score. Assignments on a resource run back to back from the base start.
*/
class GreedySearch final : public SearchAlgorithm {
 public:
  model::Algorithm algorithm() const override { return model::Algorithm::kGreedy; }

  SearchOutcome Run(const SearchContext& context) const override;

  // Descending by priority*efficiency + time/duration + cost/(duration*cheapest rate).
  static std::vector<const model::Process*> OrderProcesses(const std::vector<model::Process>&  processes,
                                                           const std::vector<model::Resource>& resources,
                                                           const ObjectiveWeights&             weights);
};

} // namespace planner::optimization
