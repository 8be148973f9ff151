#include "uuid.hpp"

#include <spdlog/fmt/fmt.h>

#include <cstdint>
#include <random>

namespace planner::util {

std::string GenerateId() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  const std::uint64_t high = rng();
  const std::uint64_t low  = rng();

  // Version nibble 4, variant bits 10.
  const auto time_low = static_cast<std::uint32_t>(high >> 32);
  const auto time_mid = static_cast<std::uint16_t>(high >> 16);
  const auto time_hi  = static_cast<std::uint16_t>((high & 0x0FFF) | 0x4000);
  const auto clock    = static_cast<std::uint16_t>(((low >> 48) & 0x3FFF) | 0x8000);
  const auto node     = low & 0xFFFFFFFFFFFFULL;

  return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}", time_low, time_mid, time_hi, clock, node);
}

} // namespace planner::util
