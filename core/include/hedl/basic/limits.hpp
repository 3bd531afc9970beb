// hedl/basic/limits.hpp - Resource bounds applied while parsing and resolving
//
// Each field bounds one resource an adversarial document could exhaust.
// Limits is plain configuration: construct once per call, pass by const
// reference, never share mutable.
//
#pragma once

#include <cstddef>
#include <limits>

namespace hedl
{

struct Limits
{
  /// Total input size in bytes
  size_t max_file_size = size_t{1024} * 1024 * 1024;

  /// Length of a single line in bytes
  size_t max_line_length = size_t{1024} * 1024;

  /// Lexical indentation depth (levels of two spaces)
  size_t max_indent_depth = 50;

  /// Matrix rows across the whole document
  size_t max_nodes = 10'000'000;

  /// Number of %ALIAS directives
  size_t max_aliases = 10'000;

  /// Columns in a single %STRUCT or inline schema
  size_t max_columns = 100;

  /// Entity hierarchy depth through %NEST children
  size_t max_nest_depth = 100;

  /// Size of a single string or block string literal in bytes
  size_t max_block_string_size = size_t{10} * 1024 * 1024;

  /// Keys in a single object
  size_t max_object_keys = 10'000;

  /// Keys across the whole document
  size_t max_total_keys = 10'000'000;

  /// Production-safe defaults
  static constexpr Limits defaults() noexcept { return Limits{}; }

  /// Every bound set to the maximum representable value, for trusted input
  static constexpr Limits unlimited() noexcept
  {
    constexpr size_t k_max = std::numeric_limits<size_t>::max();
    Limits l;
    l.max_file_size = k_max;
    l.max_line_length = k_max;
    l.max_indent_depth = k_max;
    l.max_nodes = k_max;
    l.max_aliases = k_max;
    l.max_columns = k_max;
    l.max_nest_depth = k_max;
    l.max_block_string_size = k_max;
    l.max_object_keys = k_max;
    l.max_total_keys = k_max;
    return l;
  }
};

}  // namespace hedl
