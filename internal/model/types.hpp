#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace planner::model {

enum class Priority : std::uint8_t {
  kLow      = 1,
  kMedium   = 5,
  kHigh     = 8,
  kCritical = 10,
};

constexpr int PriorityValue(Priority priority) {
  return static_cast<int>(priority);
}

enum class ProcessType : std::uint8_t {
  kRoutine     = 0,
  kSpecial     = 1,
  kUrgent      = 2,
  kMaintenance = 3,
};

enum class ResourceType : std::uint8_t {
  kHuman         = 0,
  kMaterial      = 1,
  kTechnological = 2,
  kSpatial       = 3,
  kFinancial     = 4,
};

enum class ResourceStatus : std::uint8_t {
  kAvailable   = 0,
  kAssigned    = 1,
  kBusy        = 2,
  kMaintenance = 3,
  kInactive    = 4,
  kRetired     = 5,
};

enum class ExperienceLevel : std::uint8_t {
  kJunior       = 0,
  kIntermediate = 1,
  kSenior       = 2,
  kExpert       = 3,
};

// Ordering / tie-break policy of the greedy allocator.
enum class Strategy : std::uint8_t {
  kPriority    = 0,
  kEfficiency  = 1,
  kCostMinimum = 2,
  kTimeMinimum = 3,
  kBalanced    = 4,
};

enum class Algorithm : std::uint8_t {
  kGreedy             = 0,
  kGenetic            = 1,
  kSimulatedAnnealing = 2,
  kLinear             = 3,
  kBranchAndBound     = 4,
};

constexpr std::string_view ToString(Priority priority) {
  switch (priority) {
    case Priority::kLow:
      return "low";
    case Priority::kMedium:
      return "medium";
    case Priority::kHigh:
      return "high";
    case Priority::kCritical:
      return "critical";
  }
  return "medium";
}

constexpr std::string_view ToString(ResourceType type) {
  switch (type) {
    case ResourceType::kHuman:
      return "human";
    case ResourceType::kMaterial:
      return "material";
    case ResourceType::kTechnological:
      return "technological";
    case ResourceType::kSpatial:
      return "spatial";
    case ResourceType::kFinancial:
      return "financial";
  }
  return "material";
}

constexpr std::string_view ToString(ResourceStatus status) {
  switch (status) {
    case ResourceStatus::kAvailable:
      return "available";
    case ResourceStatus::kAssigned:
      return "assigned";
    case ResourceStatus::kBusy:
      return "busy";
    case ResourceStatus::kMaintenance:
      return "maintenance";
    case ResourceStatus::kInactive:
      return "inactive";
    case ResourceStatus::kRetired:
      return "retired";
  }
  return "inactive";
}

constexpr std::string_view ToString(Strategy strategy) {
  switch (strategy) {
    case Strategy::kPriority:
      return "priority";
    case Strategy::kEfficiency:
      return "efficiency";
    case Strategy::kCostMinimum:
      return "cost_minimum";
    case Strategy::kTimeMinimum:
      return "time_minimum";
    case Strategy::kBalanced:
      return "balanced";
  }
  return "balanced";
}

constexpr std::string_view ToString(Algorithm algorithm) {
  switch (algorithm) {
    case Algorithm::kGreedy:
      return "greedy";
    case Algorithm::kGenetic:
      return "genetic";
    case Algorithm::kSimulatedAnnealing:
      return "simulated_annealing";
    case Algorithm::kLinear:
      return "linear";
    case Algorithm::kBranchAndBound:
      return "branch_and_bound";
  }
  return "greedy";
}

// Boundary parsers (config files); core code only sees the enums.
constexpr std::optional<Strategy> ParseStrategy(std::string_view value) {
  for (auto strategy : {Strategy::kPriority, Strategy::kEfficiency, Strategy::kCostMinimum, Strategy::kTimeMinimum, Strategy::kBalanced}) {
    if (ToString(strategy) == value) return strategy;
  }
  return std::nullopt;
}

constexpr std::optional<Algorithm> ParseAlgorithm(std::string_view value) {
  for (auto algorithm :
       {Algorithm::kGreedy, Algorithm::kGenetic, Algorithm::kSimulatedAnnealing, Algorithm::kLinear, Algorithm::kBranchAndBound}) {
    if (ToString(algorithm) == value) return algorithm;
  }
  return std::nullopt;
}

} // namespace planner::model
