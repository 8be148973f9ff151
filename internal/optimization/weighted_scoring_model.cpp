#include "weighted_scoring_model.hpp"

namespace planner::optimization {

bool WeightedScoringModel::IsFeasible(const model::Process& process, const model::Resource& resource,
                                      const allocation::OccupancyLedger& ledger) const {
  return allocation::HasLedgerHeadroom(process, resource, ledger) && allocation::IsCapabilityCompatible(process, resource);
}

double WeightedScoringModel::Score(const model::Process& process, const model::Resource& resource,
                                   const allocation::OccupancyLedger& /*ledger*/) const {
  return -PairCost(process, resource, weights_);
}

double WeightedScoringModel::PairCost(const model::Process& process, const model::Resource& resource, const ObjectiveWeights& weights) {
  const double duration   = process.estimated_hours();
  const double cost       = resource.CostForHours(duration);
  const double efficiency = resource.AvailableCapacity() / resource.max_capacity();
  return weights.cost * cost + weights.time * duration - weights.efficiency * efficiency;
}

} // namespace planner::optimization
