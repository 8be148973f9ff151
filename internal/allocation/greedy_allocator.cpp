#include "greedy_allocator.hpp"

#include "internal/model/types.hpp"

namespace planner::allocation {

GreedyAllocator::GreedyAllocator(const ScoringModel& scoring, Timeline timeline, util::TimePoint base_start)
    : scoring_(scoring), timeline_(timeline), base_start_(base_start) {
}

AllocationOutcome GreedyAllocator::Run(const std::vector<const model::Process*>&  ordered_processes,
                                       const std::vector<const model::Resource*>& resources) const {
  AllocationOutcome outcome;

  for (const auto* process : ordered_processes) {
    const auto* resource = SelectResource(*process, resources, outcome.ledger);
    if (!resource) {
      outcome.unassigned.push_back(process);
      continue;
    }

    outcome.assignments.push_back(MakeAssignment(*process, *resource, outcome.ledger.Hours(resource->id())));
    outcome.ledger.Commit(resource->id(), process->estimated_hours());
  }

  return outcome;
}

const model::Resource* GreedyAllocator::SelectResource(const model::Process& process, const std::vector<const model::Resource*>& resources,
                                                       const OccupancyLedger& ledger) const {
  const model::Resource* best       = nullptr;
  double                 best_score = 0.0;

  for (const auto* resource : resources) {
    if (!scoring_.IsFeasible(process, *resource, ledger)) {
      continue;
    }

    const double score = scoring_.Score(process, *resource, ledger);
    // Strict comparison: the first resource keeps a tie.
    if (!best || score > best_score) {
      best       = resource;
      best_score = score;
    }
  }

  return best;
}

model::Assignment GreedyAllocator::MakeAssignment(const model::Process& process, const model::Resource& resource,
                                                  double occupied_hours) const {
  const double duration = process.estimated_hours();
  const auto   interval = ProjectInterval(timeline_, base_start_, occupied_hours, duration, resource.HoursPerDay());

  model::Assignment assignment;
  assignment.process_id     = process.id();
  assignment.resource_id    = resource.id();
  assignment.hours_assigned = duration;
  assignment.start_time     = interval.start;
  assignment.end_time       = interval.end;
  assignment.priority       = model::PriorityValue(process.priority());
  assignment.estimated_cost = resource.CostForHours(duration);
  return assignment;
}

} // namespace planner::allocation
