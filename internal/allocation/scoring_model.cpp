#include "scoring_model.hpp"

namespace planner::allocation {

std::size_t MatchedCapabilities(const model::Process& process, const model::Resource& resource) {
  std::size_t matched = 0;
  for (const auto& capability : process.required_capabilities()) {
    if (resource.Satisfies(capability)) {
      ++matched;
    }
  }
  return matched;
}

bool IsCapabilityCompatible(const model::Process& process, const model::Resource& resource) {
  return process.required_capabilities().empty() || MatchedCapabilities(process, resource) > 0;
}

bool HasLedgerHeadroom(const model::Process& process, const model::Resource& resource, const OccupancyLedger& ledger) {
  const double duration = process.estimated_hours();
  if (!resource.CanAssign(duration)) {
    return false;
  }
  return ledger.Hours(resource.id()) + duration <= resource.AvailableCapacity();
}

} // namespace planner::allocation
