#include "commit.hpp"

#include <string>
#include <unordered_map>

#include "internal/util/errors.hpp"

namespace planner::allocation {

void CommitAssignments(const std::vector<model::Assignment>& assignments, std::vector<model::Resource>& resources, util::TimePoint now) {
  std::unordered_map<std::string, model::Resource*> by_id;
  for (auto& resource : resources) {
    by_id.emplace(resource.id(), &resource);
  }

  for (const auto& assignment : assignments) {
    auto it = by_id.find(assignment.resource_id);
    if (it == by_id.end()) {
      throw util::NotFound("resource " + assignment.resource_id + " is not part of the pool");
    }
    it->second->Assign(assignment.process_id, assignment.hours_assigned, now);
  }
}

} // namespace planner::allocation
