#include "branch_and_bound_search.hpp"

#include "internal/optimization/greedy_search.hpp"

namespace planner::optimization {

SearchOutcome BranchAndBoundSearch::Run(const SearchContext& context) const {
  return GreedySearch().Run(context);
}

} // namespace planner::optimization
