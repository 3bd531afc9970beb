// hedl/sema/reference_resolver.cpp - Reference validation implementation
#include "hedl/sema/reference_resolver.hpp"

#include <fmt/core.h>

#include <string>
#include <utility>
#include <vector>

namespace hedl
{

namespace
{

std::string join_types(const std::vector<std::string> & types)
{
  std::string out;
  for (size_t i = 0; i < types.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += types[i];
  }
  return out;
}

class ReferenceResolver
{
public:
  ReferenceResolver(const Document & doc, const Limits & limits, bool strict)
  : doc_(doc), limits_(limits), strict_(strict)
  {
  }

  bool collect() { return collect_object(doc_.root, 0); }
  bool validate() { return validate_object(doc_.root, 0); }

  [[nodiscard]] TypeRegistry & registry() noexcept { return registry_; }
  [[nodiscard]] HedlError take_error() { return std::move(*error_); }

private:
  // --------------------------------------------------------------------------
  // Depth guards
  // --------------------------------------------------------------------------

  bool check_nest_depth(size_t depth, size_t line)
  {
    if (depth > limits_.max_nest_depth) {
      return fail(HedlError::security(
        fmt::format(
          "NEST hierarchy depth {} exceeds maximum allowed depth {}", depth,
          limits_.max_nest_depth),
        line));
    }
    return true;
  }

  bool check_object_depth(size_t depth)
  {
    if (depth > limits_.max_indent_depth) {
      return fail(HedlError::security(fmt::format(
        "object nesting depth {} exceeds maximum allowed depth {}", depth,
        limits_.max_indent_depth)));
    }
    return true;
  }

  // --------------------------------------------------------------------------
  // Collection pass
  // --------------------------------------------------------------------------

  bool collect_object(const Object & object, size_t depth)
  {
    for (const auto & [key, item] : object) {
      if (item.is_object()) {
        if (!check_object_depth(depth + 1) || !collect_object(item.as_object(), depth + 1)) {
          return false;
        }
      } else if (item.is_list()) {
        if (!collect_nodes(item.as_list().rows, 0)) {
          return false;
        }
      }
    }
    return true;
  }

  bool collect_nodes(const std::vector<Node> & nodes, size_t depth)
  {
    for (const Node & node : nodes) {
      auto status = registry_.register_id(node.type_name, node.id, node.line);
      if (!status) {
        return fail(status.error());
      }
      for (const auto & [child_type, children] : node.children) {
        if (!check_nest_depth(depth + 1, node.line) || !collect_nodes(children, depth + 1)) {
          return false;
        }
      }
    }
    return true;
  }

  // --------------------------------------------------------------------------
  // Validation pass
  // --------------------------------------------------------------------------

  bool validate_object(const Object & object, size_t depth)
  {
    for (const auto & [key, item] : object) {
      if (item.is_scalar()) {
        if (!check_value(item.as_scalar(), nullptr, 0)) {
          return false;
        }
      } else if (item.is_object()) {
        if (!check_object_depth(depth + 1) || !validate_object(item.as_object(), depth + 1)) {
          return false;
        }
      } else if (!validate_nodes(item.as_list().rows, 0)) {
        return false;
      }
    }
    return true;
  }

  bool validate_nodes(const std::vector<Node> & nodes, size_t depth)
  {
    for (const Node & node : nodes) {
      for (const Value & v : node.fields) {
        if (!check_value(v, &node.type_name, node.line)) {
          return false;
        }
      }
      for (const auto & [child_type, children] : node.children) {
        if (!check_nest_depth(depth + 1, node.line) || !validate_nodes(children, depth + 1)) {
          return false;
        }
      }
    }
    return true;
  }

  bool check_value(const Value & value, const std::string * current_type, size_t line)
  {
    if (!value.is_reference()) {
      return true;
    }
    const Reference & ref = value.as_reference();

    if (ref.type_name) {
      if (registry_.contains(*ref.type_name, ref.id)) {
        return true;
      }
      return unresolved(ref, line);
    }

    if (current_type != nullptr) {
      if (registry_.contains(*current_type, ref.id)) {
        return true;
      }
      return unresolved(ref, line);
    }

    const auto & types = registry_.types_with_id(ref.id);
    if (types.size() == 1) {
      return true;
    }
    if (types.size() >= 2) {
      HedlError err = HedlError::reference(
        fmt::format(
          "Ambiguous unqualified reference '@{}' matches multiple types: [{}]", ref.id,
          join_types(types)),
        line);
      err.with_help(fmt::format("qualify it, e.g. '@{}:{}'", types.front(), ref.id));
      return fail(std::move(err));
    }
    return unresolved(ref, line);
  }

  bool unresolved(const Reference & ref, size_t line)
  {
    if (!strict_) {
      return true;
    }
    return fail(
      HedlError::reference(fmt::format("unresolved reference {}", ref.to_ref_string()), line));
  }

  bool fail(HedlError error)
  {
    error_ = std::move(error);
    return false;
  }

  const Document & doc_;
  const Limits & limits_;
  bool strict_;
  TypeRegistry registry_;
  std::optional<HedlError> error_;
};

}  // namespace

Status resolve_references(const Document & doc, bool strict, const Limits & limits)
{
  ReferenceResolver resolver(doc, limits, strict);
  if (!resolver.collect() || !resolver.validate()) {
    return Status::fail(resolver.take_error());
  }
  return Status::ok();
}

Result<TypeRegistry> collect_entities(const Document & doc, const Limits & limits)
{
  ReferenceResolver resolver(doc, limits, false);
  if (!resolver.collect()) {
    return Result<TypeRegistry>::fail(resolver.take_error());
  }
  return Result<TypeRegistry>::ok(std::move(resolver.registry()));
}

}  // namespace hedl
