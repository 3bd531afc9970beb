// hedl/canonical/canonical_writer.hpp - Deterministic Document serializer
//
// Output is byte-stable for equal documents, re-parses to an equivalent
// Document, and canonicalizing that output again yields the same bytes.
//
#pragma once

#include <cstddef>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "hedl/basic/error.hpp"
#include "hedl/canonical/canonical_config.hpp"
#include "hedl/model/document.hpp"

namespace hedl
{

/**
 * Serializes a Document in canonical form.
 *
 * Header: %VERSION, %ALIAS (sorted), %STRUCT (sorted, with recomputed row
 * counts), %NEST (sorted), `---`. Body: keys in sorted order, two spaces per
 * indentation level, rows as `|id,v1,v2` with `^` for repeated cells.
 *
 * Shapes that would not read back are rejected: an unqualified key-value
 * reference whose id names a struct (Reference error) and NEST children
 * without a matching %NEST declaration (Schema error).
 */
class CanonicalWriter
{
public:
  explicit CanonicalWriter(CanonicalConfig config = {}) : config_(config) {}

  [[nodiscard]] Result<std::string> write(const Document & doc);

  /// Format a value as it appears after `key: `
  [[nodiscard]] std::string format_scalar(const Value & value) const;

  /// Format a value as it appears in a matrix cell
  [[nodiscard]] std::string format_cell(const Value & value) const;

private:
  void write_header(const Document & doc);

  bool write_object(const Object & object, size_t indent);
  bool write_scalar(const std::string & key, const Value & value, size_t indent);
  bool write_list(const std::string & key, const MatrixList & list, size_t indent);
  bool write_rows(const std::vector<Node> & rows, size_t indent);

  bool check_depth(size_t indent);

  void collect_structs(const Object & object);
  void collect_rows(const std::vector<Node> & rows);

  CanonicalConfig config_;
  const Document * doc_ = nullptr;
  std::string out_;

  std::map<std::string, std::vector<std::string>, std::less<>> structs_;
  std::map<std::string, size_t, std::less<>> counts_;
  std::optional<HedlError> error_;
};

/// Canonicalize with the default configuration
[[nodiscard]] Result<std::string> canonicalize(const Document & doc);

[[nodiscard]] Result<std::string> canonicalize_with_config(
  const Document & doc, const CanonicalConfig & config);

/// Canonicalize onto a stream; a failed stream is an IO error
[[nodiscard]] Status canonicalize_to(
  std::ostream & os, const Document & doc, const CanonicalConfig & config = {});

// ============================================================================
// Quoting helpers
// ============================================================================

/// Whether a key-value string must be quoted to re-parse as the same string
[[nodiscard]] bool needs_quoting_scalar(std::string_view s);

/// Whether a matrix cell string must be quoted to re-parse as the same string
[[nodiscard]] bool needs_quoting_cell(std::string_view s);

/// Quote and escape a string: `""` for quotes, backslash escapes for control chars
[[nodiscard]] std::string quote_string(std::string_view s);

}  // namespace hedl
