#pragma once

#include <cstdint>
#include <string_view>

namespace planner::model {

enum class ProcessStatus : std::uint8_t {
  kPending    = 0,
  kInProgress = 1,
  kCompleted  = 2,
  kPaused     = 3,
  kCancelled  = 4,
  kError      = 5,
};

constexpr std::string_view ToString(ProcessStatus status) {
  switch (status) {
    case ProcessStatus::kPending:
      return "pending";
    case ProcessStatus::kInProgress:
      return "in_progress";
    case ProcessStatus::kCompleted:
      return "completed";
    case ProcessStatus::kPaused:
      return "paused";
    case ProcessStatus::kCancelled:
      return "cancelled";
    case ProcessStatus::kError:
      return "error";
  }
  return "error";
}

// Only pending processes take part in allocation.
constexpr bool IsAssignable(ProcessStatus status) {
  return status == ProcessStatus::kPending;
}

constexpr bool CanTransition(ProcessStatus from, ProcessStatus to) {
  switch (to) {
    case ProcessStatus::kInProgress:
      // start or resume
      return from == ProcessStatus::kPending || from == ProcessStatus::kPaused;
    case ProcessStatus::kPaused:
      return from == ProcessStatus::kInProgress;
    case ProcessStatus::kCompleted:
      return from == ProcessStatus::kInProgress || from == ProcessStatus::kPaused;
    case ProcessStatus::kCancelled:
      return from != ProcessStatus::kCompleted;
    case ProcessStatus::kError:
      return true;
    case ProcessStatus::kPending:
      return false;
  }
  return false;
}

} // namespace planner::model
