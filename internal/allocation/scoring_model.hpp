#pragma once

#include <cstddef>

#include "internal/allocation/occupancy_ledger.hpp"
#include "internal/model/process.hpp"
#include "internal/model/resource.hpp"

namespace planner::allocation {

/*
  Suitability of a (process, resource) pair for the greedy allocator.

  IsFeasible must hold before Score is consulted. Higher scores win; ties go
  to the resource seen first. Implementations read the ledger but never
  modify it.
*/
class ScoringModel {
 public:
  virtual ~ScoringModel() = default;

  virtual bool IsFeasible(const model::Process& process, const model::Resource& resource,
                          const OccupancyLedger& ledger) const = 0;

  virtual double Score(const model::Process& process, const model::Resource& resource,
                       const OccupancyLedger& ledger) const = 0;
};

// Number of required capabilities the resource satisfies (by tag or by name).
std::size_t MatchedCapabilities(const model::Process& process, const model::Resource& resource);

// True when the process requires nothing or the resource matches at least one tag.
bool IsCapabilityCompatible(const model::Process& process, const model::Resource& resource);

// Capacity headroom net of what this call has already committed to the resource.
bool HasLedgerHeadroom(const model::Process& process, const model::Resource& resource, const OccupancyLedger& ledger);

} // namespace planner::allocation
