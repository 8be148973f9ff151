#pragma once

#include <vector>

#include "internal/model/assignment.hpp"
#include "internal/model/resource.hpp"
#include "internal/util/time.hpp"

namespace planner::allocation {

/*
  Applies a finished plan to caller-owned resources through Resource::Assign,
  which records the audit trail.

  Throws util::NotFound for an unknown resource id and util::InvalidState when
  a resource can no longer take its share. Assignments applied before the
  failure stay applied.
*/
void CommitAssignments(const std::vector<model::Assignment>& assignments, std::vector<model::Resource>& resources,
                       util::TimePoint now = util::Now());

} // namespace planner::allocation
