#pragma once

#include <vector>

#include "internal/model/constraints.hpp"
#include "internal/model/process.hpp"
#include "internal/model/resource.hpp"
#include "internal/model/types.hpp"

namespace planner::allocation {

/*
  Narrows the resource pool and orders the work for one allocation call.

  Stateless. Returned pointers refer into the caller's vectors and are valid
  for as long as those vectors are not modified.
*/
class ConstraintFilter {
 public:
  // Throws util::InvalidRestriction when a per-resource cap is <= 0.
  static void ValidateRestrictions(const model::ConstraintSet& constraints);

  // Throws util::InvalidProcessState when any process is not pending.
  static void ValidateProcesses(const std::vector<model::Process>& processes);

  // Available with spare capacity, not forbidden, and mandatory-only when
  // mandatory ids are given. Input order is preserved.
  static std::vector<const model::Resource*> FilterResources(const std::vector<model::Resource>& resources,
                                                             const model::ConstraintSet&         constraints);

  // Priority-listed processes first (in input order), then the rest; each
  // partition is stable-sorted by the strategy's key.
  static std::vector<const model::Process*> OrderProcesses(const std::vector<model::Process>&         processes,
                                                           model::Strategy                            strategy,
                                                           const model::ConstraintSet&                constraints,
                                                           const std::vector<const model::Resource*>& resources);

  // Duration times the cheapest compatible hourly rate, summed per required
  // capability; duration times the cheapest positive rate when none are required.
  static double EstimateProcessCost(const model::Process& process, const std::vector<const model::Resource*>& resources);
};

} // namespace planner::allocation
