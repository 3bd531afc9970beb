// hedl/test_support/parse_helpers.hpp - helpers for unit tests
//
// Wraps parse + canonicalize so tests can state expectations on text.
//
#pragma once

#include <string>
#include <string_view>

#include "hedl/basic/error.hpp"
#include "hedl/basic/limits.hpp"
#include "hedl/canonical/canonical_writer.hpp"
#include "hedl/model/document.hpp"
#include "hedl/syntax/parser.hpp"

namespace hedl::test_support
{

/// Every bound set to zero
[[nodiscard]] inline Limits zero_limits()
{
  Limits l;
  l.max_file_size = 0;
  l.max_line_length = 0;
  l.max_indent_depth = 0;
  l.max_nodes = 0;
  l.max_aliases = 0;
  l.max_columns = 0;
  l.max_nest_depth = 0;
  l.max_block_string_size = 0;
  l.max_object_keys = 0;
  l.max_total_keys = 0;
  return l;
}

/// Parse `src` and canonicalize it with `config`
[[nodiscard]] inline Result<std::string> canonical_text(
  std::string_view src, const CanonicalConfig & config = {})
{
  auto doc = parse(src);
  if (!doc) {
    return Result<std::string>::fail(doc.error());
  }
  return canonicalize_with_config(doc.value(), config);
}

/// Top-level item of a parsed document, nullptr when absent
[[nodiscard]] inline const Item * root_item(const Document & doc, std::string_view key)
{
  auto it = doc.root.find(key);
  return it == doc.root.end() ? nullptr : &it->second;
}

}  // namespace hedl::test_support
