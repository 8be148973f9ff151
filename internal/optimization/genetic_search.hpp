#pragma once

#include <vector>

#include "internal/optimization/search_algorithm.hpp"

namespace planner::optimization {

/*
  Generational GA over direct encodings: gene i is the index of the
  resource process i goes to.

  Decoding walks the genes in process order and drops any gene whose
  resource cannot take the process any more. Dropped genes are not repaired.
*/
class GeneticSearch final : public SearchAlgorithm {
 public:
  static constexpr int    kPopulationSize = 50;
  static constexpr int    kTournamentSize = 3;
  static constexpr double kCrossoverRate  = 0.8;
  static constexpr double kMutationRate   = 0.1;
  // Early stopping is only considered after this many generations.
  static constexpr int kMinGenerations = 100;

  using Chromosome = std::vector<std::size_t>;

  model::Algorithm algorithm() const override { return model::Algorithm::kGenetic; }

  SearchOutcome Run(const SearchContext& context) const override;

  static std::vector<model::Assignment> Decode(const Chromosome& genes, const SearchContext& context);
};

} // namespace planner::optimization
