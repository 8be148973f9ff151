#include "internal/capacity/capacity_estimator.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <limits>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using planner::capacity::CapacityEstimator;
using planner::capacity::PlanningWindow;
using planner::model::ConstraintSet;
using planner::model::Process;
using planner::model::Resource;
using planner::model::ResourceType;
using planner::util::AddDays;
using planner::util::TimePoint;

// Monday 2030-01-07 00:00 UTC.
TimePoint Monday() {
  return TimePoint{} + std::chrono::hours(24 * 21921);
}

PlanningWindow OneWeek() {
  return {Monday(), AddDays(Monday(), 7)};
}

std::vector<Process> TwoProcesses() {
  return {Process("short", 6.0), Process("long", 10.0)};
}

void TestWorkingDaysSkipWeekends() {
  const auto monday = Monday();
  assert(CapacityEstimator::CountWorkingDays(monday, AddDays(monday, 7)) == 5);
  assert(CapacityEstimator::CountWorkingDays(monday, AddDays(monday, 14)) == 10);
  assert(CapacityEstimator::CountWorkingDays(AddDays(monday, 5), AddDays(monday, 7)) == 0);
  assert(CapacityEstimator::CountWorkingDays(monday, AddDays(monday, 1)) == 1);
}

void TestEstimateForOneResource() {
  std::vector<Resource> resources{Resource("lathe", ResourceType::kMaterial, 100.0, 20.0)};

  auto report = CapacityEstimator::Estimate(OneWeek(), resources, TwoProcesses(), std::nullopt, Monday());

  assert(report.working_days == 5);
  assert(report.total_available_hours == 40.0);
  assert(report.per_resource.size() == 1);
  assert(report.per_resource[0].resource_name == "lathe");
  assert(report.per_resource[0].process_capacity == 5);
  assert(report.possible_process_count == 2);
  assert(report.total_required_hours == 16.0);
  assert(report.projected_efficiency == 40.0);
  // Low efficiency and a small pool.
  assert(report.recommendations.size() == 2);
}

void TestNoProcessesMeansNoCapacity() {
  std::vector<Resource> resources{Resource("lathe", ResourceType::kMaterial, 100.0)};

  auto report = CapacityEstimator::Estimate(OneWeek(), resources, {}, std::nullopt, Monday());
  assert(report.per_resource[0].process_capacity == 0);
  assert(report.possible_process_count == 0);
  assert(report.projected_efficiency == 0.0);
}

void TestInvalidWindowIsRejected() {
  std::vector<Resource> resources{Resource("lathe", ResourceType::kMaterial, 100.0)};

  bool threw = false;
  try {
    (void)CapacityEstimator::Estimate({Monday(), Monday()}, resources, TwoProcesses(), std::nullopt, Monday());
  } catch (const planner::util::InvalidWindow&) {
    threw = true;
  }
  assert(threw);
}

void TestEmptyPoolIsRejected() {
  bool threw = false;
  try {
    (void)CapacityEstimator::Estimate(OneWeek(), {}, TwoProcesses(), std::nullopt, Monday());
  } catch (const planner::util::NoResources&) {
    threw = true;
  }
  assert(threw);
}

void TestPastWindowIsRejected() {
  std::vector<Resource> resources{Resource("lathe", ResourceType::kMaterial, 100.0)};

  bool threw = false;
  try {
    (void)CapacityEstimator::Estimate(OneWeek(), resources, TwoProcesses(), std::nullopt, AddDays(Monday(), 2));
  } catch (const planner::util::PastWindow&) {
    threw = true;
  }
  assert(threw);

  // Earlier the same day is still allowed.
  auto later_today = planner::util::AddHours(Monday(), 10.0);
  (void)CapacityEstimator::Estimate(OneWeek(), resources, TwoProcesses(), std::nullopt, later_today);
}

void TestAddingResourcesNeverLowersCapacity() {
  std::vector<Process> processes;
  for (int i = 0; i < 20; ++i) {
    processes.emplace_back("job", 4.0 + i % 3);
  }

  std::vector<Resource> pool{Resource("a", ResourceType::kMaterial, 100.0)};
  auto                  before = CapacityEstimator::Estimate(OneWeek(), pool, processes, std::nullopt, Monday());

  for (int i = 0; i < 3; ++i) {
    pool.emplace_back("extra", ResourceType::kHuman, 40.0);
    auto after = CapacityEstimator::Estimate(OneWeek(), pool, processes, std::nullopt, Monday());
    assert(after.total_available_hours >= before.total_available_hours);
    assert(after.possible_process_count >= before.possible_process_count);
    before = after;
  }
}

void TestRestrictionsCapAndExclude() {
  std::vector<Resource> resources{Resource("a", ResourceType::kMaterial, 100.0), Resource("b", ResourceType::kMaterial, 100.0)};

  ConstraintSet restrictions;
  restrictions.max_hours_per_resource = 16.0;
  restrictions.forbidden_resource_ids = {resources[1].id()};

  auto report = CapacityEstimator::Estimate(OneWeek(), resources, TwoProcesses(), restrictions, Monday());
  assert(report.per_resource.size() == 1);
  assert(report.total_available_hours == 16.0);
  assert(report.per_resource[0].process_capacity == 2);

  restrictions.max_hours_per_resource = 0.0;
  bool threw = false;
  try {
    (void)CapacityEstimator::Estimate(OneWeek(), resources, TwoProcesses(), restrictions, Monday());
  } catch (const planner::util::InvalidRestriction&) {
    threw = true;
  }
  assert(threw);
}

void TestUnevenCapacitySuggestsRebalancing() {
  std::vector<Resource> resources{Resource("fast", ResourceType::kMaterial, 100.0), Resource("slow", ResourceType::kMaterial, 100.0),
                                  Resource("other", ResourceType::kMaterial, 100.0)};
  planner::model::WorkSchedule one_hour;
  one_hour.start_minute = 8 * 60;
  one_hour.end_minute   = 9 * 60;
  one_hour.break_hours  = 0.0;
  resources[1].set_work_schedule(one_hour);

  std::vector<Process> processes{Process("tiny", 1.0)};
  auto                 report = CapacityEstimator::Estimate(OneWeek(), resources, processes, std::nullopt, Monday());

  assert(report.per_resource[0].process_capacity == 40);
  assert(report.per_resource[1].process_capacity == 5);

  bool rebalance = false;
  for (const auto& text : report.recommendations) {
    if (text.find("rebalancing") != std::string::npos) rebalance = true;
  }
  assert(rebalance);
}

void TestTinyProcessesSaturateCapacity() {
  std::vector<Resource> resources{Resource("alice", ResourceType::kHuman, 40.0), Resource("bob", ResourceType::kHuman, 40.0)};
  std::vector<Process>  processes{Process("tick", 1e-8)};

  auto report = CapacityEstimator::Estimate({Monday(), AddDays(Monday(), 28)}, resources, processes, std::nullopt, Monday());

  assert(report.working_days == 20);
  assert(report.per_resource[0].process_capacity == std::numeric_limits<int>::max());
  assert(report.per_resource[1].process_capacity == std::numeric_limits<int>::max());
  assert(report.possible_process_count == 1);
}

} // namespace

int main() {
  TestWorkingDaysSkipWeekends();
  TestEstimateForOneResource();
  TestNoProcessesMeansNoCapacity();
  TestInvalidWindowIsRejected();
  TestEmptyPoolIsRejected();
  TestPastWindowIsRejected();
  TestAddingResourcesNeverLowersCapacity();
  TestRestrictionsCapAndExclude();
  TestUnevenCapacitySuggestsRebalancing();
  TestTinyProcessesSaturateCapacity();

  std::cout << "resource_planner_unit_capacity_estimator: pass\n";
  return 0;
}
