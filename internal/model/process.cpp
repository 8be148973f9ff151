#include "process.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace planner::model {

namespace {

void AddUnique(std::vector<std::string>& values, const std::string& value) {
  if (std::find(values.begin(), values.end(), value) == values.end()) {
    values.push_back(value);
  }
}

void RemoveValue(std::vector<std::string>& values, const std::string& value) {
  values.erase(std::remove(values.begin(), values.end(), value), values.end());
}

} // namespace

Process::Process(std::string name, double estimated_hours, Priority priority, std::vector<std::string> required_capabilities,
                 ProcessType type)
    : id_(util::GenerateId()),
      name_(std::move(name)),
      type_(type),
      estimated_hours_(estimated_hours),
      priority_(priority) {
  if (name_.find_first_not_of(" \t\r\n") == std::string::npos) {
    throw util::InvalidArgument("process name must not be empty");
  }
  if (!(estimated_hours_ > 0.0)) {
    throw util::InvalidArgument("estimated hours must be greater than 0 for process " + name_);
  }
  for (const auto& capability : required_capabilities) {
    AddUnique(required_capabilities_, capability);
  }
}

void Process::AddRequiredCapability(const std::string& capability) {
  AddUnique(required_capabilities_, capability);
}

void Process::RemoveRequiredCapability(const std::string& capability) {
  RemoveValue(required_capabilities_, capability);
}

void Process::AddDependency(const std::string& process_id) {
  if (process_id == id_) {
    throw util::InvalidArgument("process " + name_ + " cannot depend on itself");
  }
  AddUnique(dependencies_, process_id);
}

void Process::RemoveDependency(const std::string& process_id) {
  RemoveValue(dependencies_, process_id);
}

void Process::Transition(ProcessStatus to, const char* verb) {
  if (!CanTransition(status_, to)) {
    throw util::InvalidState(std::string("cannot ") + verb + " process " + name_ + " in state " + std::string(ToString(status_)));
  }
  status_ = to;
}

void Process::Start(const std::optional<std::string>& assignee, util::TimePoint now) {
  if (status_ != ProcessStatus::kPending) {
    throw util::InvalidState("cannot start process " + name_ + " in state " + std::string(ToString(status_)));
  }
  Transition(ProcessStatus::kInProgress, "start");
  start_time_ = now;
  if (assignee) {
    assigned_to_ = assignee;
  }
}

void Process::Pause(const std::string& reason, util::TimePoint now) {
  Transition(ProcessStatus::kPaused, "pause");
  if (!reason.empty()) {
    AddNote("Paused: " + reason, now);
  }
}

void Process::Resume(util::TimePoint now) {
  if (status_ != ProcessStatus::kPaused) {
    throw util::InvalidState("cannot resume process " + name_ + " in state " + std::string(ToString(status_)));
  }
  Transition(ProcessStatus::kInProgress, "resume");
  AddNote("Resumed", now);
}

void Process::Complete(std::optional<double> actual_hours, util::TimePoint now) {
  Transition(ProcessStatus::kCompleted, "complete");
  end_time_ = now;
  if (actual_hours) {
    actual_hours_ = actual_hours;
  } else if (start_time_) {
    actual_hours_ = util::HoursBetween(*start_time_, now);
  }
}

void Process::Cancel(const std::string& reason, util::TimePoint now) {
  Transition(ProcessStatus::kCancelled, "cancel");
  end_time_ = now;
  if (!reason.empty()) {
    AddNote("Cancelled: " + reason, now);
  }
}

void Process::MarkError(const std::string& message, util::TimePoint now) {
  Transition(ProcessStatus::kError, "fail");
  end_time_ = now;
  AddNote("Error: " + message, now);
}

void Process::AddNote(const std::string& note, util::TimePoint now) {
  auto line = "[" + util::FormatTimestamp(now) + "] " + note;
  if (notes_.empty()) {
    notes_ = std::move(line);
  } else {
    notes_ += "\n" + line;
  }
}

double Process::Progress(util::TimePoint now) const {
  switch (status_) {
    case ProcessStatus::kCompleted:
      return 1.0;
    case ProcessStatus::kInProgress:
    case ProcessStatus::kPaused:
      if (!start_time_) return 0.5;
      return std::clamp(util::HoursBetween(*start_time_, now) / estimated_hours_, 0.0, 1.0);
    default:
      return 0.0;
  }
}

bool Process::IsOverdue(util::TimePoint now) const {
  if (!deadline_) return false;
  if (status_ == ProcessStatus::kCompleted) {
    return end_time_ && *end_time_ > *deadline_;
  }
  return now > *deadline_;
}

std::optional<double> Process::RemainingHours(util::TimePoint now) const {
  switch (status_) {
    case ProcessStatus::kCompleted:
      return 0.0;
    case ProcessStatus::kPending:
      return estimated_hours_;
    case ProcessStatus::kInProgress:
    case ProcessStatus::kPaused:
      if (start_time_) {
        return std::max(0.0, estimated_hours_ - util::HoursBetween(*start_time_, now));
      }
      return std::nullopt;
    default:
      return std::nullopt;
  }
}

} // namespace planner::model
