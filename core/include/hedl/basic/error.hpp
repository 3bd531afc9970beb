// hedl/basic/error.hpp - Error taxonomy and result types for the document engine
//
// Every entry point is fail-fast: the first error wins and is returned to
// the caller together with the 1-based source line where it is known.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace hedl
{

// ============================================================================
// Error Kind
// ============================================================================

/**
 * Category of a HEDL error.
 *
 * Syntax, Security, Collision and Reference are the primary categories.
 * The remaining kinds refine malformed-input failures.
 */
enum class ErrorKind : uint8_t {
  Syntax,     ///< Malformed token, line or directive
  Version,    ///< Missing or malformed %VERSION
  Schema,     ///< Undeclared or conflicting %STRUCT
  Alias,      ///< Duplicate or undefined alias
  Shape,      ///< Row cell count does not match the schema
  Semantic,   ///< Misplaced ~ or ^, invalid id cell
  OrphanRow,  ///< Nested row without a parent row
  Collision,  ///< Duplicate (type, id)
  Reference,  ///< Unresolved (strict) or ambiguous reference
  Security,   ///< A Limits bound was exceeded
  IO,         ///< Output stream failure
};

constexpr std::string_view to_string(ErrorKind kind) noexcept
{
  switch (kind) {
    case ErrorKind::Syntax:
      return "Syntax";
    case ErrorKind::Version:
      return "Version";
    case ErrorKind::Schema:
      return "Schema";
    case ErrorKind::Alias:
      return "Alias";
    case ErrorKind::Shape:
      return "Shape";
    case ErrorKind::Semantic:
      return "Semantic";
    case ErrorKind::OrphanRow:
      return "OrphanRow";
    case ErrorKind::Collision:
      return "Collision";
    case ErrorKind::Reference:
      return "Reference";
    case ErrorKind::Security:
      return "Security";
    case ErrorKind::IO:
      return "IO";
  }
  return "Unknown";
}

// ============================================================================
// HedlError
// ============================================================================

struct HedlError
{
  ErrorKind kind = ErrorKind::Syntax;
  std::string message;
  size_t line = 0;  ///< 1-based, 0 when unknown
  std::optional<std::string> help_message;

  static HedlError syntax(std::string msg, size_t line = 0);
  static HedlError version(std::string msg, size_t line = 0);
  static HedlError schema(std::string msg, size_t line = 0);
  static HedlError alias(std::string msg, size_t line = 0);
  static HedlError shape(std::string msg, size_t line = 0);
  static HedlError semantic(std::string msg, size_t line = 0);
  static HedlError orphan_row(std::string msg, size_t line = 0);
  static HedlError collision(std::string msg, size_t line = 0);
  static HedlError reference(std::string msg, size_t line = 0);
  static HedlError security(std::string msg, size_t line = 0);
  static HedlError io(std::string msg);

  HedlError & with_help(std::string help)
  {
    help_message = std::move(help);
    return *this;
  }

  /// "{Kind}Error at line {line}: {message}"
  [[nodiscard]] std::string to_string() const;
};

// ============================================================================
// Result
// ============================================================================

/**
 * Either a value or the error that prevented producing it.
 */
template <typename T>
class Result
{
public:
  /// Create a successful result
  static Result ok(T value)
  {
    Result r;
    r.value_ = std::move(value);
    return r;
  }

  /// Create a failed result
  static Result fail(HedlError error)
  {
    Result r;
    r.error_ = std::move(error);
    return r;
  }

  [[nodiscard]] bool is_ok() const noexcept { return value_.has_value(); }
  explicit operator bool() const noexcept { return is_ok(); }

  [[nodiscard]] const T & value() const & { return value_.value(); }
  [[nodiscard]] T & value() & { return value_.value(); }
  [[nodiscard]] T && value() && { return std::move(value_.value()); }

  /// Error of a failed result (only valid if is_ok() == false)
  [[nodiscard]] const HedlError & error() const { return error_.value(); }

private:
  Result() = default;

  std::optional<T> value_;
  std::optional<HedlError> error_;
};

/**
 * Result of an operation that produces no value.
 */
class Status
{
public:
  static Status ok() { return Status{}; }

  static Status fail(HedlError error)
  {
    Status s;
    s.error_ = std::move(error);
    return s;
  }

  [[nodiscard]] bool is_ok() const noexcept { return !error_.has_value(); }
  explicit operator bool() const noexcept { return is_ok(); }

  [[nodiscard]] const HedlError & error() const { return error_.value(); }

private:
  std::optional<HedlError> error_;
};

}  // namespace hedl
