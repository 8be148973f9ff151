#pragma once

#include <chrono>
#include <optional>
#include <random>
#include <vector>

#include "internal/model/assignment.hpp"
#include "internal/model/process.hpp"
#include "internal/model/resource.hpp"
#include "internal/model/types.hpp"
#include "internal/optimization/optimization_params.hpp"
#include "internal/util/time.hpp"

namespace planner::optimization {

/*
  Everything one search run may read. The generator is the only source of
  randomness for the whole call; nothing else may reseed or replace it.
*/
struct SearchContext {
  const std::vector<model::Process>&                   processes;
  const std::vector<model::Resource>&                  resources;
  const OptimizationParams&                            params;
  std::mt19937_64&                                     rng;
  util::TimePoint                                      base_start;
  std::optional<std::chrono::steady_clock::time_point> deadline;

  bool DeadlineExpired() const { return deadline && std::chrono::steady_clock::now() >= *deadline; }
};

struct SearchOutcome {
  std::vector<model::Assignment> assignments;
  double                         objective      = 0.0;
  int                            iterations     = 0;
  bool                           converged      = false;
  model::Algorithm               algorithm_used = model::Algorithm::kGreedy;
  bool                           fell_back      = false;
};

class SearchAlgorithm {
 public:
  virtual ~SearchAlgorithm() = default;

  virtual model::Algorithm algorithm() const = 0;

  virtual SearchOutcome Run(const SearchContext& context) const = 0;
};

} // namespace planner::optimization
