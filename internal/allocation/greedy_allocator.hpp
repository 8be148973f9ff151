#pragma once

#include <vector>

#include "internal/allocation/occupancy_ledger.hpp"
#include "internal/allocation/scoring_model.hpp"
#include "internal/allocation/timeline.hpp"
#include "internal/model/assignment.hpp"
#include "internal/model/process.hpp"
#include "internal/model/resource.hpp"
#include "internal/util/time.hpp"

namespace planner::allocation {

struct AllocationOutcome {
  std::vector<model::Assignment>     assignments;
  std::vector<const model::Process*> unassigned;
  OccupancyLedger                    ledger;
};

/*
  Single pass over ordered processes; each one takes the best-scoring
  feasible resource or ends up unassigned. No retries, no backtracking.

  The input resources are never mutated. Usage is tracked in the ledger of
  the returned outcome.
*/
class GreedyAllocator {
 public:
  GreedyAllocator(const ScoringModel& scoring, Timeline timeline, util::TimePoint base_start);

  AllocationOutcome Run(const std::vector<const model::Process*>&  ordered_processes,
                        const std::vector<const model::Resource*>& resources) const;

  // Best feasible resource for the process, or nullptr.
  const model::Resource* SelectResource(const model::Process& process, const std::vector<const model::Resource*>& resources,
                                        const OccupancyLedger& ledger) const;

 private:
  model::Assignment MakeAssignment(const model::Process& process, const model::Resource& resource, double occupied_hours) const;

  const ScoringModel& scoring_;
  Timeline            timeline_;
  util::TimePoint     base_start_;
};

} // namespace planner::allocation
