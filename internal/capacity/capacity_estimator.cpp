#include "capacity_estimator.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <utility>

#include "internal/allocation/constraint_filter.hpp"
#include "internal/util/errors.hpp"

namespace planner::capacity {

namespace {
constexpr double      kLowEfficiencyPercent  = 50.0;
constexpr double      kHighEfficiencyPercent = 90.0;
constexpr int         kMaxCapacitySpread     = 5;
constexpr std::size_t kMinResourceCount      = 3;

// Whole processes of the given length that fit into hours, saturated at INT_MAX.
int ProcessesThatFit(double hours, double average_duration) {
  if (average_duration <= 0.0) {
    return 0;
  }
  const double fit = std::floor(hours / average_duration);
  if (fit >= static_cast<double>(std::numeric_limits<int>::max())) {
    return std::numeric_limits<int>::max();
  }
  return static_cast<int>(fit);
}

std::vector<std::string> BuildRecommendations(const CapacityReport& report, std::size_t resource_count) {
  std::vector<std::string> out;

  if (report.projected_efficiency < kLowEfficiencyPercent) {
    out.emplace_back("Projected efficiency is low: consider adding resources or extending the planning window.");
  } else if (report.projected_efficiency > kHighEfficiencyPercent) {
    out.emplace_back("Projected efficiency is high: there is room to schedule additional processes.");
  }

  if (!report.per_resource.empty()) {
    auto [min_it, max_it] = std::minmax_element(report.per_resource.begin(), report.per_resource.end(),
                                                [](const ResourceCapacity& a, const ResourceCapacity& b) {
                                                  return a.process_capacity < b.process_capacity;
                                                });
    if (max_it->process_capacity - min_it->process_capacity > kMaxCapacitySpread) {
      out.emplace_back("Resource capacity is uneven: consider rebalancing the workload between resources.");
    }
  }

  if (resource_count < kMinResourceCount) {
    out.emplace_back("Few resources are available: consider diversifying the resource pool.");
  }

  return out;
}

} // namespace

int CapacityEstimator::CountWorkingDays(util::TimePoint start, util::TimePoint end) {
  int  days    = 0;
  auto current = start;
  while (current < end) {
    if (util::Weekday(current) < 5) {
      ++days;
    }
    current = util::AddDays(current, 1);
  }
  return days;
}

CapacityReport CapacityEstimator::Estimate(const PlanningWindow& window, const std::vector<model::Resource>& resources,
                                           const std::vector<model::Process>&         processes,
                                           const std::optional<model::ConstraintSet>& restrictions, util::TimePoint now) {
  if (window.start >= window.end) {
    throw util::InvalidWindow("planning window start must be before its end");
  }
  if (resources.empty()) {
    throw util::NoResources("at least one resource is required to estimate capacity");
  }
  if (window.start < util::StartOfDay(now)) {
    throw util::PastWindow("planning window starts in the past: " + util::FormatTimestamp(window.start));
  }
  if (restrictions) {
    allocation::ConstraintFilter::ValidateRestrictions(*restrictions);
  }

  CapacityReport report;
  report.working_days = CountWorkingDays(window.start, window.end);

  double average_duration = 0.0;
  if (!processes.empty()) {
    double total = 0.0;
    for (const auto& process : processes) {
      total += process.estimated_hours();
    }
    average_duration = total / static_cast<double>(processes.size());
  }

  std::int64_t capacity_sum   = 0;
  std::size_t resource_count = 0;
  for (const auto& resource : resources) {
    if (restrictions && restrictions->IsForbidden(resource.id())) {
      continue;
    }
    ++resource_count;

    double hours = resource.HoursPerDay() * static_cast<double>(report.working_days);
    if (restrictions && restrictions->max_hours_per_resource) {
      hours = std::min(hours, *restrictions->max_hours_per_resource);
    }

    ResourceCapacity entry;
    entry.resource_id      = resource.id();
    entry.resource_name    = resource.name();
    entry.available_hours  = hours;
    entry.process_capacity = ProcessesThatFit(hours, average_duration);

    report.total_available_hours += hours;
    capacity_sum += entry.process_capacity;
    report.per_resource.push_back(std::move(entry));
  }

  report.possible_process_count = static_cast<int>(std::min(capacity_sum, static_cast<std::int64_t>(processes.size())));
  report.total_required_hours   = average_duration * static_cast<double>(report.possible_process_count);

  if (report.total_available_hours > 0.0) {
    report.projected_efficiency = std::min(100.0, report.total_required_hours / report.total_available_hours * 100.0);
  }

  report.recommendations = BuildRecommendations(report, resource_count);
  return report;
}

} // namespace planner::capacity
