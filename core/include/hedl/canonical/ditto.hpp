// hedl/canonical/ditto.hpp - Repeated-value compression for matrix rows
//
#pragma once

#include <gsl/span>
#include <vector>

#include "hedl/model/value.hpp"

namespace hedl
{

/**
 * Whether `current` may be written as `^` after `previous` in the same
 * column. Values must be of the same kind and equal; NaN equals NaN,
 * and floats must also agree in sign so -0.0 never dittoes 0.0.
 */
[[nodiscard]] bool can_use_ditto(const Value & current, const Value & previous);

/**
 * Per-column ditto decisions for one row against the row before it.
 *
 * Columns beyond the shorter row are never dittoed.
 */
[[nodiscard]] std::vector<bool> ditto_mask(
  gsl::span<const Value> current, gsl::span<const Value> previous);

}  // namespace hedl
