// hedl/sema/reference_resolver.hpp - Cross-entity reference validation
//
#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

#include "hedl/basic/error.hpp"
#include "hedl/basic/limits.hpp"
#include "hedl/model/document.hpp"
#include "hedl/sema/type_registry.hpp"

namespace hedl
{

/**
 * Validate every reference in a document.
 *
 * Two depth-first passes over the document, both checked against
 * `limits.max_nest_depth` before entering any NEST child list:
 * 1. Collection: register every node's (type, id, line). A duplicate is a
 *    Collision error regardless of `strict`.
 * 2. Validation: resolve every Reference value.
 *    - `@Type:id` is looked up in Type only
 *    - `@id` inside a matrix row is looked up in the row's own type only
 *    - `@id` in a key-value scalar is looked up across all types; two or
 *      more matches is an ambiguity error regardless of `strict`
 *    Unresolved references are errors only when `strict` is true.
 *
 * The document is never modified.
 */
[[nodiscard]] Status resolve_references(
  const Document & doc, bool strict, const Limits & limits = Limits{});

/**
 * Run the collection pass only and return the populated registry.
 */
[[nodiscard]] Result<TypeRegistry> collect_entities(const Document & doc, const Limits & limits);

}  // namespace hedl
