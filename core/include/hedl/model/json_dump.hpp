// hedl/model/json_dump.hpp - JSON serialization for document trees
//
// Returns nlohmann::json objects describing a Document for debugging and
// structural comparison in tests.
//
#pragma once

#include <nlohmann/json.hpp>

#include "hedl/model/document.hpp"

namespace hedl
{

/**
 * Serialize a value as a tagged object: `{"kind": "int", "value": 5}`.
 *
 * References carry `type` (or null) and `id`; tensors carry a nested array.
 */
[[nodiscard]] nlohmann::json to_json(const Value & value);

/**
 * Serialize a whole document.
 *
 * Layout: `version`, `aliases`, `structs`, `nests` and `root`, where lists
 * appear as `{"list": Type, "schema": [...], "rows": [...]}`.
 */
[[nodiscard]] nlohmann::json to_json(const Document & doc);

}  // namespace hedl
