#include "occupancy_ledger.hpp"

namespace planner::allocation {

double OccupancyLedger::Hours(const std::string& resource_id) const {
  auto it = entries_.find(resource_id);
  return it == entries_.end() ? 0.0 : it->second.hours;
}

int OccupancyLedger::Count(const std::string& resource_id) const {
  auto it = entries_.find(resource_id);
  return it == entries_.end() ? 0 : it->second.count;
}

void OccupancyLedger::Commit(const std::string& resource_id, double hours) {
  auto& entry = entries_[resource_id];
  entry.hours += hours;
  entry.count += 1;
}

} // namespace planner::allocation
