#pragma once

#include <string>

namespace planner::util {

// Random RFC 4122 version 4 id in canonical 8-4-4-4-12 form. Used for
// process and resource ids; never parsed back.
std::string GenerateId();

} // namespace planner::util
