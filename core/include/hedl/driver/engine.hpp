// hedl/driver/engine.hpp - Parse pipeline driver
//
// Single entry point combining parsing and reference resolution.
// Used by tools that load documents from memory or from disk.
//
#pragma once

#include <filesystem>
#include <string_view>

#include "hedl/basic/error.hpp"
#include "hedl/basic/limits.hpp"
#include "hedl/model/document.hpp"

namespace hedl
{

// ============================================================================
// Parse Options
// ============================================================================

struct ParseOptions
{
  /// Resource bounds applied to parsing and resolution
  Limits limits;

  /// Run resolve_references() after a successful parse
  bool resolve_refs = false;

  /// Treat unresolved references as errors (only used with resolve_refs)
  bool strict_refs = true;
};

// ============================================================================
// Entry Points
// ============================================================================

/**
 * Parse a document and optionally validate its references.
 *
 * @param bytes Complete input buffer
 * @param options Limits and resolution settings
 * @return The parsed document, or the first error
 */
[[nodiscard]] Result<Document> parse_with_options(
  std::string_view bytes, const ParseOptions & options);

/**
 * Read a file and parse it with parse_with_options().
 *
 * A missing or unreadable file is an IO error.
 */
[[nodiscard]] Result<Document> parse_file(
  const std::filesystem::path & path, const ParseOptions & options = {});

}  // namespace hedl
