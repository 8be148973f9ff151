#include "resource.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace planner::model {

namespace {

constexpr double kDefaultHoursPerDay  = 8.0;
constexpr double kDefaultHoursPerWeek = 40.0;

} // namespace

double WorkSchedule::HoursPerDay() const {
  const double total_hours = (end_minute - start_minute) / 60.0;
  return std::max(0.0, total_hours - break_hours);
}

double WorkSchedule::HoursPerWeek() const {
  return HoursPerDay() * static_cast<double>(weekdays.size());
}

Resource::Resource(std::string name, ResourceType type, double max_capacity, double cost_per_hour, std::vector<std::string> capabilities)
    : id_(util::GenerateId()), name_(std::move(name)), type_(type), max_capacity_(max_capacity), cost_per_hour_(cost_per_hour) {
  if (name_.find_first_not_of(" \t\r\n") == std::string::npos) {
    throw util::InvalidArgument("resource name must not be empty");
  }
  if (!(max_capacity_ > 0.0)) {
    throw util::InvalidArgument("max capacity must be greater than 0 for resource " + name_);
  }
  if (cost_per_hour_ < 0.0) {
    throw util::InvalidArgument("cost per hour must not be negative for resource " + name_);
  }
  for (const auto& capability : capabilities) {
    AddCapability(capability);
  }

  // Human resources default to 08:00-17:00, Monday to Friday, 1h break.
  if (type_ == ResourceType::kHuman) {
    work_schedule_ = WorkSchedule{};
  }
}

void Resource::SetCurrentCapacity(double current_capacity) {
  if (current_capacity < 0.0) {
    throw util::InvalidArgument("current capacity must not be negative for resource " + name_);
  }
  if (current_capacity > max_capacity_) {
    throw util::InvalidArgument("current capacity exceeds max capacity for resource " + name_);
  }
  current_capacity_ = current_capacity;
}

double Resource::UtilizationPercent() const {
  return current_capacity_ / max_capacity_ * 100.0;
}

double Resource::HoursPerDay() const {
  return work_schedule_ ? work_schedule_->HoursPerDay() : kDefaultHoursPerDay;
}

double Resource::HoursPerWeek() const {
  return work_schedule_ ? work_schedule_->HoursPerWeek() : kDefaultHoursPerWeek;
}

bool Resource::IsExperienced() const {
  return experience_ && (*experience_ == ExperienceLevel::kSenior || *experience_ == ExperienceLevel::kExpert);
}

bool Resource::IsAvailable() const {
  return status_ == ResourceStatus::kAvailable && AvailableCapacity() > 0.0;
}

bool Resource::CanAssign(double amount) const {
  return amount > 0.0 && IsAvailable() && AvailableCapacity() >= amount;
}

void Resource::Assign(const std::string& process_id, double amount, util::TimePoint now) {
  if (!CanAssign(amount)) {
    throw util::InvalidState("resource " + name_ + " cannot take process " + process_id);
  }
  if (std::find(assigned_processes_.begin(), assigned_processes_.end(), process_id) != assigned_processes_.end()) {
    throw util::InvalidState("process " + process_id + " is already assigned to resource " + name_);
  }

  const double before = current_capacity_;
  assigned_processes_.push_back(process_id);
  current_capacity_ += amount;

  if (current_capacity_ >= max_capacity_) {
    status_ = ResourceStatus::kAssigned;
  }

  history_.push_back(CapacityRecord{process_id, amount, CapacityAction::kAssigned, now, before, current_capacity_});
}

void Resource::Release(const std::string& process_id, util::TimePoint now) {
  auto it = std::find(assigned_processes_.begin(), assigned_processes_.end(), process_id);
  if (it == assigned_processes_.end()) {
    throw util::NotFound("process " + process_id + " is not assigned to resource " + name_);
  }

  // Latest assignment of this process carries the amount to give back.
  double released = 0.0;
  for (auto record = history_.rbegin(); record != history_.rend(); ++record) {
    if (record->process_id == process_id && record->action == CapacityAction::kAssigned) {
      released = record->amount;
      break;
    }
  }

  const double before = current_capacity_;
  assigned_processes_.erase(it);
  current_capacity_ = std::max(0.0, current_capacity_ - released);

  if (current_capacity_ < max_capacity_ && status_ == ResourceStatus::kAssigned) {
    status_ = ResourceStatus::kAvailable;
  }

  history_.push_back(CapacityRecord{process_id, released, CapacityAction::kReleased, now, before, current_capacity_});
}

void Resource::ChangeStatus(ResourceStatus status, const std::string& reason, util::TimePoint now) {
  status_changes_.push_back(StatusChange{now, status_, status, reason});
  status_ = status;
}

void Resource::AddCapability(const std::string& capability) {
  if (!HasCapability(capability)) {
    capabilities_.push_back(capability);
  }
}

void Resource::RemoveCapability(const std::string& capability) {
  capabilities_.erase(std::remove(capabilities_.begin(), capabilities_.end(), capability), capabilities_.end());
}

bool Resource::HasCapability(const std::string& capability) const {
  return std::find(capabilities_.begin(), capabilities_.end(), capability) != capabilities_.end();
}

bool Resource::Satisfies(const std::string& requirement) const {
  return HasCapability(requirement) || requirement == name_;
}

ResourceStats Resource::Stats() const {
  ResourceStats stats;
  stats.total_assignments    = history_.size();
  stats.active_processes     = assigned_processes_.size();
  stats.utilization_percent  = UtilizationPercent();
  stats.available_capacity   = AvailableCapacity();
  stats.hours_per_day        = HoursPerDay();
  stats.hours_per_week       = HoursPerWeek();
  stats.weekly_cost_estimate = CostForHours(HoursPerWeek());
  stats.capabilities         = capabilities_.size();
  return stats;
}

} // namespace planner::model
