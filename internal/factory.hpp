#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/core/planner_engine.hpp"

namespace planner::factory {

/*
  Runtime

  Owns the long-lived objects of a planner process.
*/
struct Runtime {
  std::shared_ptr<core::PlannerEngine> engine;
};

/*
  Maps the config message onto engine defaults.

  Zero / empty fields keep the built-in defaults. Unknown strategy or
  algorithm names and inconsistent weights throw util::InvalidParameters.
*/
core::EngineOptions EngineOptionsFromConfig(const planner::runtime::config::RuntimeConfig& config);

/*
  BuildRuntime

  Composition root: the only place that turns configuration into objects.
*/
Runtime BuildRuntime(const planner::runtime::config::RuntimeConfig& config);

} // namespace planner::factory
