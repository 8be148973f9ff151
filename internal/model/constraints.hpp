#pragma once

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace planner::model {

/*
  Request-scoped restrictions for one allocation call. Never persisted.
*/
struct ConstraintSet {
  std::optional<int>             max_processes_per_resource;
  std::optional<double>          max_hours_per_resource;
  std::vector<std::string>       mandatory_resource_ids;
  std::vector<std::string>       forbidden_resource_ids;
  std::vector<std::string>       priority_process_ids;
  std::optional<util::TimePoint> deadline;

  bool IsForbidden(const std::string& resource_id) const {
    return std::find(forbidden_resource_ids.begin(), forbidden_resource_ids.end(), resource_id) != forbidden_resource_ids.end();
  }

  bool IsMandatory(const std::string& resource_id) const {
    return std::find(mandatory_resource_ids.begin(), mandatory_resource_ids.end(), resource_id) != mandatory_resource_ids.end();
  }

  bool IsPriorityProcess(const std::string& process_id) const {
    return std::find(priority_process_ids.begin(), priority_process_ids.end(), process_id) != priority_process_ids.end();
  }
};

} // namespace planner::model
