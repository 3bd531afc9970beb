// hedl/canonical/ditto.cpp - Ditto predicate
#include "hedl/canonical/ditto.hpp"

#include <algorithm>
#include <cmath>

namespace hedl
{

bool can_use_ditto(const Value & current, const Value & previous)
{
  // -0.0 == 0.0, but `^` would lose the sign
  if (
    current.is_float() && previous.is_float() &&
    std::signbit(current.as_float()) != std::signbit(previous.as_float())) {
    return false;
  }
  return current == previous;
}

std::vector<bool> ditto_mask(gsl::span<const Value> current, gsl::span<const Value> previous)
{
  std::vector<bool> mask(current.size(), false);
  const size_t n = std::min(current.size(), previous.size());
  for (size_t i = 0; i < n; ++i) {
    mask[i] = can_use_ditto(current[i], previous[i]);
  }
  return mask;
}

}  // namespace hedl
