#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/model/types.hpp"
#include "internal/util/time.hpp"

namespace planner::model {

/*
  Working-hours calendar of a resource.

  Times are minutes after midnight; weekdays use 0 = Monday ... 6 = Sunday.
*/
struct WorkSchedule {
  int           start_minute = 8 * 60;
  int           end_minute   = 17 * 60;
  std::set<int> weekdays{0, 1, 2, 3, 4};
  double        break_hours = 1.0;

  double HoursPerDay() const;
  double HoursPerWeek() const;
};

enum class CapacityAction : std::uint8_t {
  kAssigned = 0,
  kReleased = 1,
};

struct CapacityRecord {
  std::string     process_id;
  double          amount = 0.0;
  CapacityAction  action = CapacityAction::kAssigned;
  util::TimePoint timestamp{};
  double          before = 0.0;
  double          after  = 0.0;
};

struct StatusChange {
  util::TimePoint timestamp{};
  ResourceStatus  from = ResourceStatus::kAvailable;
  ResourceStatus  to   = ResourceStatus::kAvailable;
  std::string     reason;
};

struct ResourceStats {
  std::size_t total_assignments    = 0;
  std::size_t active_processes     = 0;
  double      utilization_percent  = 0.0;
  double      available_capacity   = 0.0;
  double      hours_per_day        = 0.0;
  double      hours_per_week       = 0.0;
  double      weekly_cost_estimate = 0.0;
  std::size_t capabilities         = 0;
};

/*
  A capacity-bounded provider (person, machine, budget line, ...).

  Invariant: 0 <= current_capacity <= max_capacity. Capacity only changes
  through Assign / Release, each of which appends an audit record.
*/
class Resource {
 public:
  Resource(std::string name, ResourceType type, double max_capacity, double cost_per_hour = 0.0,
           std::vector<std::string> capabilities = {});

  const std::string&                    id() const { return id_; }
  const std::string&                    name() const { return name_; }
  ResourceType                          type() const { return type_; }
  ResourceStatus                        status() const { return status_; }
  double                                max_capacity() const { return max_capacity_; }
  double                                current_capacity() const { return current_capacity_; }
  double                                cost_per_hour() const { return cost_per_hour_; }
  const std::vector<std::string>&       capabilities() const { return capabilities_; }
  const std::optional<ExperienceLevel>& experience() const { return experience_; }
  const std::optional<WorkSchedule>&    work_schedule() const { return work_schedule_; }
  const std::vector<std::string>&       assigned_processes() const { return assigned_processes_; }
  const std::vector<CapacityRecord>&    history() const { return history_; }
  const std::vector<StatusChange>&      status_changes() const { return status_changes_; }

  void set_experience(ExperienceLevel level) { experience_ = level; }
  void set_work_schedule(WorkSchedule schedule) { work_schedule_ = std::move(schedule); }

  // Pre-loads usage coming from outside the planner (e.g. a persisted snapshot).
  void SetCurrentCapacity(double current_capacity);

  double AvailableCapacity() const { return max_capacity_ - current_capacity_; }
  double UtilizationPercent() const;
  double HoursPerDay() const;
  double HoursPerWeek() const;

  // Senior or expert staff.
  bool IsExperienced() const;

  bool IsAvailable() const;
  bool CanAssign(double amount) const;

  void Assign(const std::string& process_id, double amount, util::TimePoint now = util::Now());
  void Release(const std::string& process_id, util::TimePoint now = util::Now());

  void ChangeStatus(ResourceStatus status, const std::string& reason = "", util::TimePoint now = util::Now());

  void AddCapability(const std::string& capability);
  void RemoveCapability(const std::string& capability);
  bool HasCapability(const std::string& capability) const;

  // Match-any compatibility: by tag, or by the resource's own name.
  bool Satisfies(const std::string& requirement) const;

  double CostForHours(double hours) const { return cost_per_hour_ * hours; }

  ResourceStats Stats() const;

 private:
  std::string                    id_;
  std::string                    name_;
  ResourceType                   type_;
  ResourceStatus                 status_ = ResourceStatus::kAvailable;
  double                         max_capacity_;
  double                         current_capacity_ = 0.0;
  double                         cost_per_hour_;
  std::vector<std::string>       capabilities_;
  std::optional<ExperienceLevel> experience_;
  std::optional<WorkSchedule>    work_schedule_;

  std::vector<std::string>    assigned_processes_;
  std::vector<CapacityRecord> history_;
  std::vector<StatusChange>   status_changes_;
};

} // namespace planner::model
