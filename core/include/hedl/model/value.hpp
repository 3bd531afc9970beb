// hedl/model/value.hpp - Scalar values stored in a HEDL document
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace hedl
{

// ============================================================================
// Reference
// ============================================================================

/**
 * Pointer to another entity: `@id` (unqualified) or `@Type:id` (qualified).
 */
struct Reference
{
  std::optional<std::string> type_name;
  std::string id;

  static Reference local(std::string id) { return Reference{std::nullopt, std::move(id)}; }

  static Reference qualified(std::string type, std::string id)
  {
    return Reference{std::move(type), std::move(id)};
  }

  [[nodiscard]] bool is_qualified() const noexcept { return type_name.has_value(); }

  /// "@id" or "@Type:id"
  [[nodiscard]] std::string to_ref_string() const;

  friend bool operator==(const Reference & a, const Reference & b)
  {
    return a.type_name == b.type_name && a.id == b.id;
  }
  friend bool operator!=(const Reference & a, const Reference & b) { return !(a == b); }
};

// ============================================================================
// Tensor
// ============================================================================

/**
 * Nested numeric array literal such as `[[1, 2], [3, 4]]`.
 */
class Tensor
{
public:
  static Tensor scalar(double value)
  {
    Tensor t;
    t.scalar_ = value;
    return t;
  }

  static Tensor array(std::vector<Tensor> elements)
  {
    Tensor t;
    t.is_array_ = true;
    t.elements_ = std::move(elements);
    return t;
  }

  [[nodiscard]] bool is_scalar() const noexcept { return !is_array_; }
  [[nodiscard]] bool is_array() const noexcept { return is_array_; }

  [[nodiscard]] double scalar_value() const noexcept { return scalar_; }
  [[nodiscard]] const std::vector<Tensor> & elements() const noexcept { return elements_; }

  /// Dimension sizes from the outermost level inward (empty for a scalar)
  [[nodiscard]] std::vector<size_t> shape() const;

  friend bool operator==(const Tensor & a, const Tensor & b);
  friend bool operator!=(const Tensor & a, const Tensor & b) { return !(a == b); }

private:
  bool is_array_ = false;
  double scalar_ = 0.0;
  std::vector<Tensor> elements_;
};

// ============================================================================
// Value
// ============================================================================

enum class ValueKind : uint8_t {
  Null,
  Bool,
  Int,
  Float,
  String,
  Reference,
  Tensor,
  Expression,  ///< `$(...)` text, stored verbatim and never evaluated
};

constexpr std::string_view to_string(ValueKind kind) noexcept
{
  switch (kind) {
    case ValueKind::Null:
      return "null";
    case ValueKind::Bool:
      return "bool";
    case ValueKind::Int:
      return "int";
    case ValueKind::Float:
      return "float";
    case ValueKind::String:
      return "string";
    case ValueKind::Reference:
      return "reference";
    case ValueKind::Tensor:
      return "tensor";
    case ValueKind::Expression:
      return "expression";
  }
  return "unknown";
}

class Value
{
public:
  Value() = default;

  // ===========================================================================
  // Factory Methods
  // ===========================================================================

  static Value make_null() { return Value{}; }

  static Value make_bool(bool value) { return Value{ValueKind::Bool, value}; }

  static Value make_int(int64_t value) { return Value{ValueKind::Int, value}; }

  static Value make_float(double value) { return Value{ValueKind::Float, value}; }

  static Value make_string(std::string value) { return Value{ValueKind::String, std::move(value)}; }

  static Value make_reference(Reference ref) { return Value{ValueKind::Reference, std::move(ref)}; }

  static Value make_tensor(Tensor tensor) { return Value{ValueKind::Tensor, std::move(tensor)}; }

  /// Create an expression value from the text between `$(` and `)`
  static Value make_expression(std::string text)
  {
    return Value{ValueKind::Expression, std::move(text)};
  }

  // ===========================================================================
  // Kind Queries
  // ===========================================================================

  [[nodiscard]] ValueKind kind() const noexcept { return kind_; }

  [[nodiscard]] bool is_null() const noexcept { return kind_ == ValueKind::Null; }
  [[nodiscard]] bool is_bool() const noexcept { return kind_ == ValueKind::Bool; }
  [[nodiscard]] bool is_int() const noexcept { return kind_ == ValueKind::Int; }
  [[nodiscard]] bool is_float() const noexcept { return kind_ == ValueKind::Float; }
  [[nodiscard]] bool is_string() const noexcept { return kind_ == ValueKind::String; }
  [[nodiscard]] bool is_reference() const noexcept { return kind_ == ValueKind::Reference; }
  [[nodiscard]] bool is_tensor() const noexcept { return kind_ == ValueKind::Tensor; }
  [[nodiscard]] bool is_expression() const noexcept { return kind_ == ValueKind::Expression; }

  // ===========================================================================
  // Value Accessors (caller checks the kind first)
  // ===========================================================================

  [[nodiscard]] bool as_bool() const { return std::get<bool>(data_); }
  [[nodiscard]] int64_t as_int() const { return std::get<int64_t>(data_); }
  [[nodiscard]] double as_float() const { return std::get<double>(data_); }

  /// Text of a String or Expression value
  [[nodiscard]] const std::string & as_string() const { return std::get<std::string>(data_); }

  [[nodiscard]] const Reference & as_reference() const { return std::get<Reference>(data_); }
  [[nodiscard]] const Tensor & as_tensor() const { return std::get<Tensor>(data_); }

  /// Float equality treats NaN as equal to NaN so that equal rows compare equal
  friend bool operator==(const Value & a, const Value & b);
  friend bool operator!=(const Value & a, const Value & b) { return !(a == b); }

private:
  using Storage = std::variant<std::monostate, bool, int64_t, double, std::string, Reference, Tensor>;

  template <typename T>
  Value(ValueKind kind, T && data) : kind_(kind), data_(std::forward<T>(data))
  {
  }

  ValueKind kind_ = ValueKind::Null;
  Storage data_;
};

}  // namespace hedl
