#pragma once

#include "internal/optimization/search_algorithm.hpp"

namespace planner::optimization {

// Stand-in: runs the greedy search and reports it as such.
class BranchAndBoundSearch final : public SearchAlgorithm {
 public:
  model::Algorithm algorithm() const override { return model::Algorithm::kBranchAndBound; }

  SearchOutcome Run(const SearchContext& context) const override;
};

} // namespace planner::optimization
