#pragma once

#include <string>
#include <unordered_map>

namespace planner::allocation {

/*
  Call-local bookkeeping of hours and process counts committed per resource.

  One ledger belongs to exactly one allocation or search call. It is never
  shared between calls, so it needs no locking.
*/
class OccupancyLedger {
 public:
  double Hours(const std::string& resource_id) const;
  int    Count(const std::string& resource_id) const;

  void Commit(const std::string& resource_id, double hours);

 private:
  struct Entry {
    double hours = 0.0;
    int    count = 0;
  };

  std::unordered_map<std::string, Entry> entries_;
};

} // namespace planner::allocation
