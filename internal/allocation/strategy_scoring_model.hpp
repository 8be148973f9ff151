#pragma once

#include "internal/allocation/scoring_model.hpp"
#include "internal/model/constraints.hpp"
#include "internal/model/types.hpp"
#include "internal/util/time.hpp"

namespace planner::allocation {

/*
  Scoring used by Distribute.

  score = utilization% * 0.1
        + 10 per satisfied required capability
        + strategy bias (cost headroom, free capacity, or experience for
          high-priority work)
*/
class StrategyScoringModel final : public ScoringModel {
 public:
  StrategyScoringModel(model::Strategy strategy, model::ConstraintSet constraints, util::TimePoint base_start);

  bool IsFeasible(const model::Process& process, const model::Resource& resource,
                  const OccupancyLedger& ledger) const override;

  double Score(const model::Process& process, const model::Resource& resource,
               const OccupancyLedger& ledger) const override;

 private:
  double StrategyBias(const model::Process& process, const model::Resource& resource) const;

  model::Strategy      strategy_;
  model::ConstraintSet constraints_;
  util::TimePoint      base_start_;
};

} // namespace planner::allocation
