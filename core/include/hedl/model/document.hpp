// hedl/model/document.hpp - Parsed HEDL document tree
//
// A Document is produced once by the parser (or built by a converter) and is
// only read afterwards by the resolver and the canonical writer.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "hedl/model/value.hpp"

namespace hedl
{

// ============================================================================
// Node
// ============================================================================

/**
 * One matrix row: an entity with an id and schema-aligned field values.
 */
struct Node
{
  std::string type_name;
  std::string id;

  /// Positionally aligned to the owning list's schema (id excluded)
  std::vector<Value> fields;

  /// NEST children grouped by child type name
  std::map<std::string, std::vector<Node>, std::less<>> children;

  /// `|[N]` prefix on the source row
  std::optional<size_t> child_count;

  /// 1-based source line (0 for nodes built programmatically); not compared
  size_t line = 0;

  Node() = default;
  Node(std::string type, std::string node_id, std::vector<Value> values = {})
  : type_name(std::move(type)), id(std::move(node_id)), fields(std::move(values))
  {
  }

  friend bool operator==(const Node & a, const Node & b)
  {
    return a.type_name == b.type_name && a.id == b.id && a.fields == b.fields &&
           a.children == b.children && a.child_count == b.child_count;
  }
  friend bool operator!=(const Node & a, const Node & b) { return !(a == b); }
};

// ============================================================================
// MatrixList
// ============================================================================

/**
 * Typed sequence of rows under one key.
 *
 * Invariant: every row has `type_name == this->type_name` and
 * `fields.size() == schema.size()`.
 */
struct MatrixList
{
  std::string type_name;

  /// Value columns in declaration order (the id column is implicit)
  std::vector<std::string> schema;

  std::vector<Node> rows;

  /// `key(N):` hint from the source; informational only
  std::optional<size_t> count_hint;

  MatrixList() = default;
  MatrixList(std::string type, std::vector<std::string> columns)
  : type_name(std::move(type)), schema(std::move(columns))
  {
  }

  friend bool operator==(const MatrixList & a, const MatrixList & b)
  {
    return a.type_name == b.type_name && a.schema == b.schema && a.rows == b.rows &&
           a.count_hint == b.count_hint;
  }
  friend bool operator!=(const MatrixList & a, const MatrixList & b) { return !(a == b); }
};

// ============================================================================
// Item
// ============================================================================

class Item;

/// Key-ordered object body
using Object = std::map<std::string, Item, std::less<>>;

enum class ItemKind : uint8_t {
  Scalar,
  List,
  Object,
};

/**
 * One slot of the document tree.
 */
class Item
{
public:
  Item() = default;
  Item(Value value) : data_(std::move(value)) {}  // NOLINT(google-explicit-constructor)
  Item(MatrixList list) : data_(std::move(list)) {}  // NOLINT(google-explicit-constructor)
  Item(Object object) : data_(std::move(object)) {}  // NOLINT(google-explicit-constructor)

  [[nodiscard]] ItemKind kind() const noexcept { return static_cast<ItemKind>(data_.index()); }

  [[nodiscard]] bool is_scalar() const noexcept { return kind() == ItemKind::Scalar; }
  [[nodiscard]] bool is_list() const noexcept { return kind() == ItemKind::List; }
  [[nodiscard]] bool is_object() const noexcept { return kind() == ItemKind::Object; }

  [[nodiscard]] const Value & as_scalar() const { return std::get<Value>(data_); }
  [[nodiscard]] const MatrixList & as_list() const { return std::get<MatrixList>(data_); }
  [[nodiscard]] const Object & as_object() const { return std::get<Object>(data_); }

  [[nodiscard]] MatrixList & as_list() { return std::get<MatrixList>(data_); }
  [[nodiscard]] Object & as_object() { return std::get<Object>(data_); }

  friend bool operator==(const Item & a, const Item & b) { return a.data_ == b.data_; }
  friend bool operator!=(const Item & a, const Item & b) { return !(a == b); }

private:
  std::variant<Value, MatrixList, Object> data_;
};

// ============================================================================
// Document
// ============================================================================

struct Document
{
  /// (major, minor) from %VERSION
  std::pair<uint32_t, uint32_t> version{1, 0};

  std::map<std::string, std::string, std::less<>> aliases;

  /// Type name -> value columns
  std::map<std::string, std::vector<std::string>, std::less<>> structs;

  /// Parent type -> child type
  std::map<std::string, std::string, std::less<>> nests;

  Object root;

  /// Schema of a declared type, nullptr when undeclared
  [[nodiscard]] const std::vector<std::string> * get_schema(std::string_view type) const;

  /// Child type declared for a parent type, nullptr when none
  [[nodiscard]] const std::string * get_child_type(std::string_view parent) const;

  friend bool operator==(const Document & a, const Document & b)
  {
    return a.version == b.version && a.aliases == b.aliases && a.structs == b.structs &&
           a.nests == b.nests && a.root == b.root;
  }
  friend bool operator!=(const Document & a, const Document & b) { return !(a == b); }
};

}  // namespace hedl
