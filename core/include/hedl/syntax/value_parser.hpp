// hedl/syntax/value_parser.hpp - Inference of typed values from unquoted tokens
//
#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "hedl/basic/error.hpp"
#include "hedl/model/value.hpp"

namespace hedl::syntax
{

using AliasTable = std::map<std::string, std::string, std::less<>>;

/**
 * Parse a bare numeric literal.
 *
 * A leading `-` or digit is required. A `.` or exponent makes the value a
 * Float (which must be finite and must not end in `.`); otherwise it is an
 * Int that must fit in 64 bits. Anything else yields std::nullopt.
 */
[[nodiscard]] std::optional<Value> try_parse_number(std::string_view text);

/// Parse `@id` or `@Type:id`
[[nodiscard]] Result<Reference> parse_reference(std::string_view text, size_t line);

/// Parse a bracketed numeric literal such as `[[1, 2], [3, 4]]`
[[nodiscard]] Result<Tensor> parse_tensor(std::string_view text, size_t line);

/**
 * Infer the value of an unquoted token.
 *
 * Order: `~` null, `true`/`false`, `@` reference, `$(...)` expression,
 * `$name` alias, `[` tensor, number, otherwise the token itself as a String.
 * The ditto marker is handled by the row parser, not here.
 */
[[nodiscard]] Result<Value> infer_value(
  std::string_view token, const AliasTable & aliases, size_t line);

/// Re-lex alias replacement text: bool, then number, otherwise String
[[nodiscard]] Value infer_alias_expansion(std::string_view text);

}  // namespace hedl::syntax
