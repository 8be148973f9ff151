#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

#include "internal/model/process.hpp"
#include "internal/model/resource.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using planner::model::CapacityAction;
using planner::model::ExperienceLevel;
using planner::model::Priority;
using planner::model::Process;
using planner::model::ProcessStatus;
using planner::model::Resource;
using planner::model::ResourceStatus;
using planner::model::ResourceType;
using planner::model::WorkSchedule;

// Monday 2030-01-07 00:00 UTC.
planner::util::TimePoint Monday() {
  return planner::util::TimePoint{} + std::chrono::hours(24 * 21921);
}

void TestProcessRejectsInvalidInput() {
  bool threw = false;
  try {
    Process("  ", 4.0);
  } catch (const planner::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    Process("build", 0.0);
  } catch (const planner::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestProcessIdsAreUniqueAndCapabilitiesDeduplicated() {
  Process a("a", 1.0, Priority::kHigh, {"python", "python", "sql"});
  Process b("b", 1.0);

  assert(a.id() != b.id());
  assert(a.required_capabilities().size() == 2);
  assert(a.status() == ProcessStatus::kPending);

  a.AddRequiredCapability("sql");
  assert(a.required_capabilities().size() == 2);
  a.RemoveRequiredCapability("python");
  assert(a.required_capabilities().size() == 1);
}

void TestProcessLifecycle() {
  const auto t0 = Monday();
  Process    process("etl", 10.0);

  process.Start(std::string("alice"), t0);
  assert(process.status() == ProcessStatus::kInProgress);
  assert(process.assigned_to() && *process.assigned_to() == "alice");
  assert(process.Progress(planner::util::AddHours(t0, 5.0)) == 0.5);

  process.Pause("waiting for data", planner::util::AddHours(t0, 2.0));
  assert(process.status() == ProcessStatus::kPaused);
  assert(process.notes().find("Paused: waiting for data") != std::string::npos);

  process.Resume(planner::util::AddHours(t0, 3.0));
  process.Complete(std::nullopt, planner::util::AddHours(t0, 12.0));
  assert(process.status() == ProcessStatus::kCompleted);
  assert(process.actual_hours() && *process.actual_hours() == 12.0);
  assert(process.Progress() == 1.0);

  bool threw = false;
  try {
    process.Cancel("too late");
  } catch (const planner::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestProcessInvalidTransitions() {
  Process process("report", 2.0);

  bool threw = false;
  try {
    process.Pause();
  } catch (const planner::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    process.Resume();
  } catch (const planner::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  process.Start();
  threw = false;
  try {
    process.Start();
  } catch (const planner::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  process.MarkError("disk full");
  assert(process.status() == ProcessStatus::kError);
  assert(process.Progress() == 0.0);
}

void TestProcessOverdueAndRemaining() {
  const auto t0 = Monday();
  Process    process("audit", 8.0);
  process.set_deadline(planner::util::AddHours(t0, 4.0));

  assert(!process.IsOverdue(t0));
  assert(process.IsOverdue(planner::util::AddHours(t0, 5.0)));
  assert(process.RemainingHours(t0) && *process.RemainingHours(t0) == 8.0);

  process.Start(std::nullopt, t0);
  assert(*process.RemainingHours(planner::util::AddHours(t0, 3.0)) == 5.0);
}

void TestResourceValidation() {
  bool threw = false;
  try {
    Resource("lathe", ResourceType::kMaterial, 0.0);
  } catch (const planner::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    Resource("lathe", ResourceType::kMaterial, 10.0, -1.0);
  } catch (const planner::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  Resource resource("lathe", ResourceType::kMaterial, 10.0);
  threw = false;
  try {
    resource.SetCurrentCapacity(11.0);
  } catch (const planner::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestResourceAssignAndReleaseKeepAuditTrail() {
  const auto t0 = Monday();
  Resource   resource("alice", ResourceType::kHuman, 10.0, 25.0, {"python"});

  resource.Assign("p1", 4.0, t0);
  assert(resource.current_capacity() == 4.0);
  assert(resource.AvailableCapacity() == 6.0);
  assert(resource.UtilizationPercent() == 40.0);
  assert(resource.status() == ResourceStatus::kAvailable);

  resource.Assign("p2", 6.0, t0);
  assert(resource.status() == ResourceStatus::kAssigned);
  assert(!resource.CanAssign(1.0));

  bool threw = false;
  try {
    resource.Assign("p3", 1.0, t0);
  } catch (const planner::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  resource.Release("p1", t0);
  assert(resource.current_capacity() == 6.0);
  assert(resource.status() == ResourceStatus::kAvailable);

  const auto& history = resource.history();
  assert(history.size() == 3);
  assert(history[0].action == CapacityAction::kAssigned && history[0].before == 0.0 && history[0].after == 4.0);
  assert(history[2].action == CapacityAction::kReleased && history[2].amount == 4.0 && history[2].after == 6.0);

  threw = false;
  try {
    resource.Release("unknown", t0);
  } catch (const planner::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestReleaseKeepsManualStatus() {
  Resource resource("press", ResourceType::kMaterial, 10.0);
  resource.Assign("p1", 2.0);
  resource.ChangeStatus(ResourceStatus::kMaintenance, "inspection");
  resource.Release("p1");

  assert(resource.status() == ResourceStatus::kMaintenance);
  assert(resource.status_changes().size() == 1);
  assert(!resource.IsAvailable());
}

void TestScheduleAndExperience() {
  Resource human("bob", ResourceType::kHuman, 40.0);
  assert(human.HoursPerDay() == 8.0);
  assert(human.HoursPerWeek() == 40.0);
  assert(!human.IsExperienced());

  human.set_experience(ExperienceLevel::kExpert);
  assert(human.IsExperienced());

  WorkSchedule part_time;
  part_time.start_minute = 9 * 60;
  part_time.end_minute   = 13 * 60;
  part_time.break_hours  = 0.0;
  part_time.weekdays     = {0, 2, 4};
  human.set_work_schedule(part_time);
  assert(human.HoursPerDay() == 4.0);
  assert(human.HoursPerWeek() == 12.0);

  Resource machine("cnc", ResourceType::kTechnological, 100.0);
  assert(!machine.work_schedule());
  assert(machine.HoursPerDay() == 8.0);
}

void TestCapabilityMatchesByTagOrName() {
  Resource resource("python", ResourceType::kTechnological, 10.0, 0.0, {"linux"});
  assert(resource.Satisfies("linux"));
  assert(resource.Satisfies("python"));
  assert(!resource.Satisfies("java"));
}

void TestStatsSummarizeCostAndLoad() {
  Resource resource("welder", ResourceType::kHuman, 20.0, 15.0, {"tig", "mig"});
  resource.Assign("p1", 5.0);
  resource.Assign("p2", 5.0);
  resource.Release("p1");

  const auto stats = resource.Stats();
  assert(stats.total_assignments == 3);
  assert(stats.active_processes == 1);
  assert(stats.utilization_percent == 25.0);
  assert(stats.available_capacity == 15.0);
  assert(stats.hours_per_week == 40.0);
  assert(stats.weekly_cost_estimate == 600.0);
  assert(stats.capabilities == 2);
  assert(resource.CostForHours(2.5) == 37.5);
}

void TestAssignRejectsNonPositiveAmounts() {
  Resource resource("oven", ResourceType::kMaterial, 10.0);
  assert(!resource.CanAssign(0.0));
  assert(!resource.CanAssign(-3.0));

  for (double amount : {0.0, -3.0}) {
    bool threw = false;
    try {
      resource.Assign("p1", amount);
    } catch (const planner::util::InvalidState&) {
      threw = true;
    }
    assert(threw);
  }
  assert(resource.current_capacity() == 0.0);
  assert(resource.history().empty());
}

void TestDependenciesAndDescription() {
  Process build("build", 2.0);
  Process test("test", 1.0);

  test.set_description("Run the regression suite");
  assert(test.description() == "Run the regression suite");

  test.AddDependency(build.id());
  test.AddDependency(build.id());
  test.AddDependency("external-approval");
  assert(test.dependencies().size() == 2);
  assert(test.dependencies()[0] == build.id());

  test.RemoveDependency(build.id());
  test.RemoveDependency("never-added");
  assert(test.dependencies().size() == 1);
  assert(test.dependencies()[0] == "external-approval");

  bool threw = false;
  try {
    test.AddDependency(test.id());
  } catch (const planner::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestCapabilitiesCanBeRemoved() {
  Resource resource("robot", ResourceType::kTechnological, 50.0, 0.0, {"weld", "paint"});
  resource.AddCapability("weld");
  assert(resource.capabilities().size() == 2);

  resource.RemoveCapability("weld");
  assert(!resource.HasCapability("weld"));
  assert(!resource.Satisfies("weld"));
  assert(resource.Satisfies("paint"));

  resource.RemoveCapability("weld");
  assert(resource.capabilities().size() == 1);
}

} // namespace

int main() {
  TestProcessRejectsInvalidInput();
  TestProcessIdsAreUniqueAndCapabilitiesDeduplicated();
  TestProcessLifecycle();
  TestProcessInvalidTransitions();
  TestProcessOverdueAndRemaining();
  TestResourceValidation();
  TestResourceAssignAndReleaseKeepAuditTrail();
  TestReleaseKeepsManualStatus();
  TestScheduleAndExperience();
  TestCapabilityMatchesByTagOrName();
  TestStatsSummarizeCostAndLoad();
  TestAssignRejectsNonPositiveAmounts();
  TestDependenciesAndDescription();
  TestCapabilitiesCanBeRemoved();

  std::cout << "resource_planner_unit_model: pass\n";
  return 0;
}
