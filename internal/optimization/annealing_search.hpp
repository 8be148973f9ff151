#pragma once

#include "internal/optimization/search_algorithm.hpp"

namespace planner::optimization {

/*
  Simulated annealing seeded with the greedy solution.

  A move re-assigns one random assignment to one random resource when that
  resource can still take it. Worse moves are accepted with exp(-delta / T);
  T cools geometrically from 1000 until it drops below 0.1.
*/
class AnnealingSearch final : public SearchAlgorithm {
 public:
  static constexpr double kInitialTemperature = 1000.0;
  static constexpr double kFinalTemperature   = 0.1;
  static constexpr double kCoolingFactor      = 0.95;

  model::Algorithm algorithm() const override { return model::Algorithm::kSimulatedAnnealing; }

  SearchOutcome Run(const SearchContext& context) const override;
};

} // namespace planner::optimization
