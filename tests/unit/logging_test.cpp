#include "internal/observability/logging.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <string>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace {

using planner::observability::BoolField;
using planner::observability::DoubleField;
using planner::observability::ResolveLoggingSettings;
using planner::observability::StringField;

void ClearEnv() {
  unsetenv("PLANNER_LOG_LEVEL");
  unsetenv("PLANNER_LOG_PATTERN");
  unsetenv("PLANNER_LOG_INCLUDE_TRACE_CONTEXT");
}

void TestFieldFormatting() {
  assert(StringField("resource", "r1").value == "r1");
  assert(StringField("process", "Frame welding").value == "\"Frame welding\"");
  assert(StringField("note", "say \"hi\"").value == "\"say \\\"hi\\\"\"");
  assert(StringField("empty", "").value == "\"\"");
  assert(DoubleField("objective", 21.44).value == "21.4400");
  assert(BoolField("converged", true).value == "true");
}

void TestDefaults() {
  ClearEnv();
  auto settings = ResolveLoggingSettings(planner::runtime::config::RuntimeConfig{});

  assert(settings.level == spdlog::level::info);
  assert(!settings.pattern.empty());
  assert(!settings.include_trace_context);
}

void TestConfigValuesApply() {
  ClearEnv();
  planner::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("debug");
  config.mutable_logging()->set_pattern("%v");
  config.mutable_logging()->set_include_trace_context(true);

  auto settings = ResolveLoggingSettings(config);
  assert(settings.level == spdlog::level::debug);
  assert(settings.pattern == "%v");
  assert(settings.include_trace_context);
}

void TestEnvironmentOverridesConfig() {
  ClearEnv();
  setenv("PLANNER_LOG_LEVEL", "error", 1);
  setenv("PLANNER_LOG_INCLUDE_TRACE_CONTEXT", "0", 1);

  planner::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("debug");
  config.mutable_logging()->set_include_trace_context(true);

  auto settings = ResolveLoggingSettings(config);
  assert(settings.level == spdlog::level::err);
  assert(!settings.include_trace_context);
  ClearEnv();
}

void TestUnknownLevelRejected() {
  ClearEnv();
  planner::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("loud");

  bool threw = false;
  try {
    (void)ResolveLoggingSettings(config);
  } catch (const planner::util::InvalidParameters&) {
    threw = true;
  }
  assert(threw);

  config.mutable_logging()->set_level("off");
  assert(ResolveLoggingSettings(config).level == spdlog::level::off);
}

} // namespace

int main() {
  TestFieldFormatting();
  TestDefaults();
  TestConfigValuesApply();
  TestEnvironmentOverridesConfig();
  TestUnknownLevelRejected();

  std::cout << "resource_planner_unit_logging: pass\n";
  return 0;
}
