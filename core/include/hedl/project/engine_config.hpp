// hedl/project/engine_config.hpp - Engine configuration (hedl.yaml)
//
// Parses hedl.yaml files carrying limits, parse and canonical settings.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "hedl/canonical/canonical_config.hpp"
#include "hedl/driver/engine.hpp"

namespace hedl
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Complete engine configuration (hedl.yaml).
 *
 * ```yaml
 * limits: unlimited          # or a map of individual Limits fields
 * parse:
 *   resolve_refs: true
 *   strict_refs: false
 * canonical:
 *   quoting: always          # minimal | always
 *   ditto: false
 *   inline_schemas: true
 *   counts: false
 *   max_depth: 64
 * ```
 */
struct EngineConfig
{
  /// Limits live in parse.limits
  ParseOptions parse;
  CanonicalConfig canonical;

  /// Directory containing hedl.yaml
  std::filesystem::path config_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct EngineConfigResult
{
  /// Loaded configuration (only valid if success == true)
  EngineConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static EngineConfigResult ok(EngineConfig cfg)
  {
    EngineConfigResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static EngineConfigResult fail(std::string msg)
  {
    EngineConfigResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load an engine configuration from a hedl.yaml file.
 *
 * Missing sections and keys keep their defaults. An unknown quoting mode or
 * a limit that is not a non-negative integer fails the load.
 */
[[nodiscard]] EngineConfigResult load_engine_config(const std::filesystem::path & config_path);

/// Parse an engine configuration from YAML text (no file access)
[[nodiscard]] EngineConfigResult parse_engine_config(const std::string & yaml_text);

/**
 * Find hedl.yaml by searching upward from start_dir to the filesystem root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_engine_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_engine_config_file_name = "hedl.yaml";

}  // namespace hedl
