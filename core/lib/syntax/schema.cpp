// hedl/syntax/schema.cpp - Column list parsing
#include "hedl/syntax/schema.hpp"

#include <fmt/core.h>

#include <algorithm>

#include "hedl/syntax/lexer.hpp"

namespace hedl::syntax
{

Result<std::vector<std::string>> parse_schema_columns(
  std::string_view text, const Limits & limits, size_t line)
{
  using R = Result<std::vector<std::string>>;

  const std::string_view t = trim(text);
  if (t.size() < 2 || t.front() != '[' || t.back() != ']') {
    return R::fail(HedlError::syntax(
      fmt::format("expected column list '[col, ...]', found '{}'", t), line));
  }

  std::vector<std::string> columns;
  const std::string_view inner = trim(t.substr(1, t.size() - 2));
  if (inner.empty()) {
    return R::ok(std::move(columns));
  }

  size_t start = 0;
  while (true) {
    const size_t comma = inner.find(',', start);
    const std::string_view col =
      trim(inner.substr(start, comma == std::string_view::npos ? inner.npos : comma - start));

    if (!is_key_token(col)) {
      return R::fail(HedlError::syntax(
        fmt::format("invalid column name '{}': expected [a-z_][a-z0-9_]*", col), line));
    }
    if (std::find(columns.begin(), columns.end(), col) != columns.end()) {
      return R::fail(HedlError::schema(fmt::format("duplicate column '{}'", col), line));
    }
    if (columns.size() >= limits.max_columns) {
      return R::fail(HedlError::security(
        fmt::format("too many columns: exceeds limit of {}", limits.max_columns), line));
    }
    columns.emplace_back(col);

    if (comma == std::string_view::npos) {
      break;
    }
    start = comma + 1;
  }

  return R::ok(std::move(columns));
}

}  // namespace hedl::syntax
