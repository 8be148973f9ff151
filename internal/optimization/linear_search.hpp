#pragma once

#include <optional>

#include "internal/optimization/search_algorithm.hpp"

namespace planner::optimization {

/*
  LP relaxation of the assignment problem, solved with OR-tools GLOP.

  One [0, 1] variable per (process, resource) cell; each process row sums
  to 1 and each resource column is bounded by its spare capacity in hours.
  Cells are thresholded at 0.5, so the result can leave a process out or
  exceed a column bound. Solver failure, infeasibility, or a build without
  OR-tools falls back to the greedy search.
*/
class LinearSearch final : public SearchAlgorithm {
 public:
  static constexpr double kAssignmentThreshold = 0.5;

  model::Algorithm algorithm() const override { return model::Algorithm::kLinear; }

  SearchOutcome Run(const SearchContext& context) const override;

 private:
  static std::optional<SearchOutcome> Solve(const SearchContext& context);
};

} // namespace planner::optimization
