#pragma once

#include "internal/allocation/scoring_model.hpp"
#include "internal/optimization/objective.hpp"

namespace planner::optimization {

/*
  Per-pair objective used by the greedy search, negated so that the
  allocator's argmax picks the cheapest pair:

    pair = cost * (duration * rate) + time * duration - efficiency * (available / max)
*/
class WeightedScoringModel final : public allocation::ScoringModel {
 public:
  explicit WeightedScoringModel(ObjectiveWeights weights) : weights_(weights) {
  }

  bool IsFeasible(const model::Process& process, const model::Resource& resource,
                  const allocation::OccupancyLedger& ledger) const override;

  double Score(const model::Process& process, const model::Resource& resource,
               const allocation::OccupancyLedger& ledger) const override;

  // Un-negated value, also used as the LP cell coefficient.
  static double PairCost(const model::Process& process, const model::Resource& resource, const ObjectiveWeights& weights);

 private:
  ObjectiveWeights weights_;
};

} // namespace planner::optimization
