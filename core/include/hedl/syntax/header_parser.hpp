// hedl/syntax/header_parser.hpp - Header directive parsing (%VERSION, %STRUCT, %ALIAS, %NEST)
//
#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

#include "hedl/basic/error.hpp"
#include "hedl/basic/limits.hpp"
#include "hedl/basic/source_text.hpp"
#include "hedl/model/document.hpp"

namespace hedl::syntax
{

/**
 * Reads the header block up to the `---` separator and fills the
 * version, structs, aliases and nests of a Document.
 */
class HeaderParser
{
public:
  HeaderParser(const SourceText & src, const Limits & limits, Document & doc)
  : src_(src), limits_(limits), doc_(doc)
  {
  }

  /// Parse the header; returns the 0-based index of the first body line
  [[nodiscard]] Result<size_t> parse();

private:
  bool parse_directive(std::string_view content, size_t line);

  bool parse_version(std::string_view payload, size_t line);
  bool parse_struct(std::string_view payload, size_t line);
  bool parse_alias(std::string_view payload, size_t line);
  bool parse_nest(std::string_view payload, size_t line);

  bool fail(HedlError error)
  {
    error_ = std::move(error);
    return false;
  }

  const SourceText & src_;
  const Limits & limits_;
  Document & doc_;

  bool saw_version_ = false;
  std::optional<HedlError> error_;
};

}  // namespace hedl::syntax
