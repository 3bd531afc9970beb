// hedl/syntax/schema.hpp - Column list parsing shared by %STRUCT and inline schemas
//
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "hedl/basic/error.hpp"
#include "hedl/basic/limits.hpp"

namespace hedl::syntax
{

/**
 * Parse a bracketed column list such as `[name, email]`.
 *
 * Columns must be key tokens and unique. The id column is implicit and is
 * not listed. More than `max_columns` columns is a Security error.
 */
[[nodiscard]] Result<std::vector<std::string>> parse_schema_columns(
  std::string_view text, const Limits & limits, size_t line);

}  // namespace hedl::syntax
