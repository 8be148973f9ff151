#include "constraint_filter.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace planner::allocation {

using model::Process;
using model::Resource;
using model::Strategy;

void ConstraintFilter::ValidateRestrictions(const model::ConstraintSet& constraints) {
  if (constraints.max_processes_per_resource && *constraints.max_processes_per_resource <= 0) {
    throw util::InvalidRestriction("max_processes_per_resource must be greater than zero");
  }

  if (constraints.max_hours_per_resource && *constraints.max_hours_per_resource <= 0.0) {
    throw util::InvalidRestriction("max_hours_per_resource must be greater than zero");
  }
}

void ConstraintFilter::ValidateProcesses(const std::vector<Process>& processes) {
  for (const auto& process : processes) {
    if (!model::IsAssignable(process.status())) {
      throw util::InvalidProcessState("process " + process.id() + " (" + process.name() + ") is " +
                                      std::string(model::ToString(process.status())) + ", only pending processes can be allocated");
    }
  }
}

std::vector<const Resource*> ConstraintFilter::FilterResources(const std::vector<Resource>& resources,
                                                               const model::ConstraintSet&  constraints) {
  std::vector<const Resource*> eligible;
  eligible.reserve(resources.size());

  for (const auto& resource : resources) {
    if (!resource.IsAvailable()) {
      continue;
    }
    if (constraints.IsForbidden(resource.id())) {
      continue;
    }
    if (!constraints.mandatory_resource_ids.empty() && !constraints.IsMandatory(resource.id())) {
      continue;
    }
    eligible.push_back(&resource);
  }

  return eligible;
}

double ConstraintFilter::EstimateProcessCost(const Process& process, const std::vector<const Resource*>& resources) {
  const double duration = process.estimated_hours();

  if (process.required_capabilities().empty()) {
    double cheapest = std::numeric_limits<double>::infinity();
    for (const auto* resource : resources) {
      if (resource->cost_per_hour() > 0.0) {
        cheapest = std::min(cheapest, resource->cost_per_hour());
      }
    }
    return std::isinf(cheapest) ? 0.0 : duration * cheapest;
  }

  double total = 0.0;
  for (const auto& capability : process.required_capabilities()) {
    double cheapest = std::numeric_limits<double>::infinity();
    for (const auto* resource : resources) {
      if (resource->Satisfies(capability)) {
        cheapest = std::min(cheapest, resource->cost_per_hour());
      }
    }
    if (!std::isinf(cheapest)) {
      total += duration * cheapest;
    }
  }
  return total;
}

std::vector<const Process*> ConstraintFilter::OrderProcesses(const std::vector<Process>&         processes,
                                                             Strategy                            strategy,
                                                             const model::ConstraintSet&         constraints,
                                                             const std::vector<const Resource*>& resources) {
  std::vector<const Process*> prioritized;
  std::vector<const Process*> rest;

  for (const auto& process : processes) {
    if (constraints.IsPriorityProcess(process.id())) {
      prioritized.push_back(&process);
    } else {
      rest.push_back(&process);
    }
  }

  auto sort_partition = [&](std::vector<const Process*>& partition) {
    switch (strategy) {
      case Strategy::kPriority:
        std::stable_sort(partition.begin(), partition.end(), [](const Process* a, const Process* b) {
          return model::PriorityValue(a->priority()) > model::PriorityValue(b->priority());
        });
        break;

      case Strategy::kTimeMinimum:
        std::stable_sort(partition.begin(), partition.end(), [](const Process* a, const Process* b) {
          return a->estimated_hours() < b->estimated_hours();
        });
        break;

      case Strategy::kCostMinimum: {
        std::vector<std::pair<const Process*, double>> keyed;
        keyed.reserve(partition.size());
        for (const auto* process : partition) {
          keyed.emplace_back(process, EstimateProcessCost(*process, resources));
        }
        std::stable_sort(keyed.begin(), keyed.end(), [](const auto& a, const auto& b) { return a.second < b.second; });
        for (std::size_t i = 0; i < keyed.size(); ++i) {
          partition[i] = keyed[i].first;
        }
        break;
      }

      case Strategy::kEfficiency:
        std::stable_sort(partition.begin(), partition.end(), [](const Process* a, const Process* b) {
          auto key = [](const Process* p) {
            const auto caps = std::max<std::size_t>(1, p->required_capabilities().size());
            return p->estimated_hours() / static_cast<double>(caps);
          };
          return key(a) < key(b);
        });
        break;

      case Strategy::kBalanced:
        break;
    }
  };

  sort_partition(prioritized);
  sort_partition(rest);

  prioritized.insert(prioritized.end(), rest.begin(), rest.end());
  return prioritized;
}

} // namespace planner::allocation
