// hedl/project/engine_config.cpp - Engine configuration implementation
//
#include "hedl/project/engine_config.hpp"

#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

#include <utility>

namespace hedl
{

namespace
{

/// Read a non-negative integer scalar
std::optional<size_t> parse_size(const YAML::Node & node)
{
  if (!node.IsScalar()) {
    return std::nullopt;
  }
  try {
    const auto value = node.as<long long>();
    if (value < 0) {
      return std::nullopt;
    }
    return static_cast<size_t>(value);
  } catch (const YAML::Exception &) {
    return std::nullopt;
  }
}

std::optional<bool> parse_bool(const YAML::Node & node)
{
  if (!node.IsScalar()) {
    return std::nullopt;
  }
  try {
    return node.as<bool>();
  } catch (const YAML::Exception &) {
    return std::nullopt;
  }
}

/// Apply a boolean key if present; returns false on a malformed value
bool read_bool(const YAML::Node & section, const char * key, bool & out, std::string & error)
{
  if (!section[key]) {
    return true;
  }
  auto value = parse_bool(section[key]);
  if (!value) {
    error = fmt::format("'{}' must be a boolean", key);
    return false;
  }
  out = *value;
  return true;
}

bool read_size(const YAML::Node & section, const char * key, size_t & out, std::string & error)
{
  if (!section[key]) {
    return true;
  }
  auto value = parse_size(section[key]);
  if (!value) {
    error = fmt::format("'{}' must be a non-negative integer", key);
    return false;
  }
  out = *value;
  return true;
}

bool parse_limits(const YAML::Node & node, Limits & limits, std::string & error)
{
  if (node.IsScalar()) {
    if (node.Scalar() == "unlimited") {
      limits = Limits::unlimited();
      return true;
    }
    if (node.Scalar() == "default") {
      limits = Limits::defaults();
      return true;
    }
    error = fmt::format("invalid limits preset: '{}' (must be 'default' or 'unlimited')",
                        node.Scalar());
    return false;
  }
  if (!node.IsMap()) {
    error = "limits must be a map or a preset name";
    return false;
  }

  return read_size(node, "max_file_size", limits.max_file_size, error) &&
         read_size(node, "max_line_length", limits.max_line_length, error) &&
         read_size(node, "max_indent_depth", limits.max_indent_depth, error) &&
         read_size(node, "max_nodes", limits.max_nodes, error) &&
         read_size(node, "max_aliases", limits.max_aliases, error) &&
         read_size(node, "max_columns", limits.max_columns, error) &&
         read_size(node, "max_nest_depth", limits.max_nest_depth, error) &&
         read_size(node, "max_block_string_size", limits.max_block_string_size, error) &&
         read_size(node, "max_object_keys", limits.max_object_keys, error) &&
         read_size(node, "max_total_keys", limits.max_total_keys, error);
}

bool parse_canonical(const YAML::Node & node, CanonicalConfig & canonical, std::string & error)
{
  if (!node.IsMap()) {
    error = "canonical must be a map";
    return false;
  }

  if (node["quoting"]) {
    const std::string mode = node["quoting"].IsScalar() ? node["quoting"].Scalar() : "";
    auto quoting = quoting_from_string(mode);
    if (!quoting) {
      error = fmt::format("invalid canonical.quoting: '{}' (must be 'minimal' or 'always')", mode);
      return false;
    }
    canonical.quoting = *quoting;
  }

  return read_bool(node, "ditto", canonical.use_ditto, error) &&
         read_bool(node, "inline_schemas", canonical.inline_schemas, error) &&
         read_bool(node, "counts", canonical.emit_counts, error) &&
         read_size(node, "max_depth", canonical.max_depth, error);
}

EngineConfigResult build_config(const YAML::Node & root, EngineConfig config)
{
  if (!root || root.IsNull()) {
    return EngineConfigResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return EngineConfigResult::fail("configuration root must be a map");
  }

  std::string error;

  if (root["limits"] && !parse_limits(root["limits"], config.parse.limits, error)) {
    return EngineConfigResult::fail("invalid limits: " + error);
  }

  if (root["parse"]) {
    const auto & parse = root["parse"];
    if (!parse.IsMap()) {
      return EngineConfigResult::fail("parse must be a map");
    }
    if (
      !read_bool(parse, "resolve_refs", config.parse.resolve_refs, error) ||
      !read_bool(parse, "strict_refs", config.parse.strict_refs, error)) {
      return EngineConfigResult::fail("invalid parse section: " + error);
    }
  }

  if (root["canonical"] && !parse_canonical(root["canonical"], config.canonical, error)) {
    return EngineConfigResult::fail("invalid canonical section: " + error);
  }

  return EngineConfigResult::ok(std::move(config));
}

}  // namespace

EngineConfigResult parse_engine_config(const std::string & yaml_text)
{
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception & e) {
    return EngineConfigResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return build_config(root, EngineConfig{});
}

EngineConfigResult load_engine_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return EngineConfigResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return EngineConfigResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  EngineConfig config;
  config.config_root = fs::absolute(config_path).parent_path();
  return build_config(root, std::move(config));
}

std::optional<std::filesystem::path> find_engine_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_engine_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace hedl
