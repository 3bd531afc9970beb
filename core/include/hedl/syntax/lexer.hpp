// hedl/syntax/lexer.hpp - Character-level scanning shared by header and body parsing
//
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "hedl/basic/error.hpp"

namespace hedl::syntax
{

// ============================================================================
// Token predicates
// ============================================================================

/// Object keys, column names and alias names: [a-z_][a-z0-9_]*
[[nodiscard]] bool is_key_token(std::string_view s) noexcept;

/// Entity ids: [A-Za-z_][A-Za-z0-9_-]*
[[nodiscard]] bool is_id_token(std::string_view s) noexcept;

/// Struct type names: [A-Z][A-Za-z0-9_]*
[[nodiscard]] bool is_type_name(std::string_view s) noexcept;

[[nodiscard]] std::string_view trim(std::string_view s) noexcept;
[[nodiscard]] std::string_view trim_end(std::string_view s) noexcept;

/// Remove a trailing `# comment` that is outside quotes and `$(...)`,
/// then trailing whitespace
[[nodiscard]] std::string_view strip_comment(std::string_view line) noexcept;

// ============================================================================
// Scanner
// ============================================================================

/**
 * Cursor over a single line of text.
 */
class Scanner
{
public:
  explicit Scanner(std::string_view src) : src_(src) {}

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;
  [[nodiscard]] size_t pos() const noexcept { return pos_; }
  [[nodiscard]] std::string_view rest() const noexcept { return src_.substr(pos_); }

  void advance(size_t n = 1) noexcept { pos_ = (pos_ + n < src_.size()) ? pos_ + n : src_.size(); }

  void skip_spaces() noexcept;

  /// Consume `c` if it is the next character
  bool match(char c) noexcept;

  /// Consume characters while `pred` holds and return them
  template <typename Pred>
  std::string_view take_while(Pred pred) noexcept
  {
    const size_t start = pos_;
    while (!eof() && pred(src_[pos_])) {
      ++pos_;
    }
    return src_.substr(start, pos_ - start);
  }

private:
  std::string_view src_;
  size_t pos_ = 0;
};

// ============================================================================
// Quoted strings and row cells
// ============================================================================

/**
 * Decode a quoted string occupying all of `text` (surrounding whitespace
 * allowed). Supports `""` doubling and the escapes \n \t \r \\ \".
 */
[[nodiscard]] Result<std::string> parse_quoted(std::string_view text, size_t line);

struct RowCell
{
  std::string text;  ///< Decoded text for quoted cells, trimmed raw text otherwise
  bool quoted = false;
};

/**
 * Split the cell part of a matrix row on top-level commas.
 *
 * Commas inside quotes, `$(...)` and `[...]` do not split.
 */
[[nodiscard]] Result<std::vector<RowCell>> split_row_cells(std::string_view row, size_t line);

}  // namespace hedl::syntax
