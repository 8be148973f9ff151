#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/state_machine.hpp"
#include "internal/model/types.hpp"
#include "internal/util/time.hpp"

namespace planner::model {

/*
  A schedulable unit of work.

  The id is generated at construction and never changes. The allocator only
  reads status(); lifecycle transitions belong to the caller.
*/
class Process {
 public:
  Process(std::string name, double estimated_hours, Priority priority = Priority::kMedium,
          std::vector<std::string> required_capabilities = {}, ProcessType type = ProcessType::kRoutine);

  const std::string&              id() const { return id_; }
  const std::string&              name() const { return name_; }
  const std::string&              description() const { return description_; }
  ProcessType                     type() const { return type_; }
  double                          estimated_hours() const { return estimated_hours_; }
  Priority                        priority() const { return priority_; }
  const std::vector<std::string>& required_capabilities() const { return required_capabilities_; }
  ProcessStatus                   status() const { return status_; }

  const std::optional<util::TimePoint>& start_time() const { return start_time_; }
  const std::optional<util::TimePoint>& end_time() const { return end_time_; }
  const std::optional<util::TimePoint>& deadline() const { return deadline_; }
  const std::optional<double>&          actual_hours() const { return actual_hours_; }
  const std::optional<std::string>&     assigned_to() const { return assigned_to_; }
  const std::vector<std::string>&       dependencies() const { return dependencies_; }
  const std::string&                    notes() const { return notes_; }

  void set_description(std::string description) { description_ = std::move(description); }
  void set_deadline(util::TimePoint deadline) { deadline_ = deadline; }

  void AddRequiredCapability(const std::string& capability);
  void RemoveRequiredCapability(const std::string& capability);
  void AddDependency(const std::string& process_id);
  void RemoveDependency(const std::string& process_id);

  // ------------------------------------------------------------------
  // Lifecycle
  // ------------------------------------------------------------------
  void Start(const std::optional<std::string>& assignee = std::nullopt, util::TimePoint now = util::Now());
  void Pause(const std::string& reason = "", util::TimePoint now = util::Now());
  void Resume(util::TimePoint now = util::Now());
  void Complete(std::optional<double> actual_hours = std::nullopt, util::TimePoint now = util::Now());
  void Cancel(const std::string& reason = "", util::TimePoint now = util::Now());
  void MarkError(const std::string& message, util::TimePoint now = util::Now());

  void AddNote(const std::string& note, util::TimePoint now = util::Now());

  // Fraction in [0, 1].
  double Progress(util::TimePoint now = util::Now()) const;

  bool IsOverdue(util::TimePoint now = util::Now()) const;

  std::optional<double> RemainingHours(util::TimePoint now = util::Now()) const;

 private:
  void Transition(ProcessStatus to, const char* verb);

  std::string              id_;
  std::string              name_;
  std::string              description_;
  ProcessType              type_;
  double                   estimated_hours_;
  Priority                 priority_;
  std::vector<std::string> required_capabilities_;
  ProcessStatus            status_ = ProcessStatus::kPending;

  std::optional<util::TimePoint> start_time_;
  std::optional<util::TimePoint> end_time_;
  std::optional<util::TimePoint> deadline_;
  std::optional<double>          actual_hours_;
  std::optional<std::string>     assigned_to_;
  std::vector<std::string>       dependencies_;
  std::string                    notes_;
};

} // namespace planner::model
