#pragma once

#include <memory>

#include "internal/model/types.hpp"
#include "internal/optimization/search_algorithm.hpp"

namespace planner::optimization {

/*
  Maps an algorithm to its search implementation.

      auto search = SearchFactory::Create(Algorithm::kGenetic);
      auto outcome = search->Run(context);
*/
class SearchFactory {
 public:
  static std::unique_ptr<SearchAlgorithm> Create(model::Algorithm algorithm);
};

} // namespace planner::optimization
