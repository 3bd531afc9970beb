// hedl/syntax/parser.hpp - Text to Document entry point
//
#pragma once

#include <string_view>

#include "hedl/basic/error.hpp"
#include "hedl/basic/limits.hpp"
#include "hedl/model/document.hpp"

namespace hedl
{

/**
 * Parse a HEDL document.
 *
 * Runs preprocessing, the header directives and the indentation-driven body
 * builder. Fail-fast: the first Syntax or Security error is returned and no
 * partial Document is produced. References are not validated here; see
 * resolve_references().
 *
 * @param bytes Complete input buffer (UTF-8)
 * @param limits Resource bounds for this call
 */
[[nodiscard]] Result<Document> parse(std::string_view bytes, const Limits & limits = Limits{});

}  // namespace hedl
