// hedl/canonical/canonical_config.hpp - Canonical writer options
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace hedl
{

enum class QuotingStrategy : uint8_t {
  Minimal,  ///< Quote strings only when they would not re-parse as themselves
  Always,   ///< Quote every string value
};

[[nodiscard]] std::optional<QuotingStrategy> quoting_from_string(std::string_view s) noexcept;
[[nodiscard]] std::string_view to_string(QuotingStrategy q) noexcept;

struct CanonicalConfig
{
  QuotingStrategy quoting = QuotingStrategy::Minimal;

  /// Emit `^` for a cell equal to the same column of the previous row
  bool use_ditto = true;

  /// Write `@Type[cols]` on list keys in addition to the %STRUCT header
  bool inline_schemas = false;

  /// Write recomputed row counts in %STRUCT headers (`Type (N): [...]`)
  bool emit_counts = true;

  /// Maximum indentation depth the writer descends to
  size_t max_depth = 1000;
};

}  // namespace hedl
