#include "strategy_scoring_model.hpp"

#include <algorithm>
#include <utility>

#include "internal/allocation/timeline.hpp"

namespace planner::allocation {

namespace {
constexpr double kUtilizationWeight     = 0.1;
constexpr double kCapabilityMatchBonus  = 10.0;
constexpr double kCostCeiling           = 100.0;
constexpr double kExperienceBonus       = 50.0;
constexpr int    kHighPriorityThreshold = 8;
} // namespace

StrategyScoringModel::StrategyScoringModel(model::Strategy strategy, model::ConstraintSet constraints, util::TimePoint base_start)
    : strategy_(strategy), constraints_(std::move(constraints)), base_start_(base_start) {
}

bool StrategyScoringModel::IsFeasible(const model::Process& process, const model::Resource& resource,
                                      const OccupancyLedger& ledger) const {
  const double duration = process.estimated_hours();
  const double occupied = ledger.Hours(resource.id());

  if (constraints_.max_hours_per_resource && occupied + duration > *constraints_.max_hours_per_resource) {
    return false;
  }

  if (constraints_.max_processes_per_resource && ledger.Count(resource.id()) >= *constraints_.max_processes_per_resource) {
    return false;
  }

  if (!HasLedgerHeadroom(process, resource, ledger)) {
    return false;
  }

  if (!IsCapabilityCompatible(process, resource)) {
    return false;
  }

  if (constraints_.deadline) {
    auto interval = ProjectInterval(Timeline::kWorkingDays, base_start_, occupied, duration, resource.HoursPerDay());
    if (interval.end > *constraints_.deadline) {
      return false;
    }
  }

  return true;
}

double StrategyScoringModel::Score(const model::Process& process, const model::Resource& resource,
                                   const OccupancyLedger& /*ledger*/) const {
  double score = resource.UtilizationPercent() * kUtilizationWeight;
  score += kCapabilityMatchBonus * static_cast<double>(MatchedCapabilities(process, resource));
  score += StrategyBias(process, resource);
  return score;
}

double StrategyScoringModel::StrategyBias(const model::Process& process, const model::Resource& resource) const {
  switch (strategy_) {
    case model::Strategy::kCostMinimum:
      return std::max(0.0, kCostCeiling - resource.cost_per_hour());

    case model::Strategy::kEfficiency:
      return resource.AvailableCapacity();

    case model::Strategy::kPriority:
      if (model::PriorityValue(process.priority()) >= kHighPriorityThreshold && resource.IsExperienced()) {
        return kExperienceBonus;
      }
      return 0.0;

    case model::Strategy::kTimeMinimum:
    case model::Strategy::kBalanced:
      break;
  }
  return 0.0;
}

} // namespace planner::allocation
