#pragma once

#include <vector>

#include "internal/model/assignment.hpp"

namespace planner::optimization {

struct ObjectiveWeights {
  double cost       = 0.4;
  double time       = 0.3;
  double efficiency = 0.3;

  double Sum() const { return cost + time + efficiency; }
};

/*
  Minimized by every search algorithm:

    cost * totalCost/n + time * makespanHours/n - efficiency * n/makespanHours

  The efficiency term is 0 when the makespan is 0. An empty set scores +inf.
*/
double Objective(const std::vector<model::Assignment>& assignments, const ObjectiveWeights& weights);

} // namespace planner::optimization
