// hedl/syntax/lexer.cpp - Line scanning helpers
#include "hedl/syntax/lexer.hpp"

#include <fmt/core.h>

#include <cstdint>
#include <optional>

namespace hedl::syntax
{

namespace
{

bool is_lower_or_underscore(char c) noexcept { return (c >= 'a' && c <= 'z') || c == '_'; }
bool is_upper(char c) noexcept { return c >= 'A' && c <= 'Z'; }
bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }
bool is_alpha(char c) noexcept { return is_lower_or_underscore(c) || is_upper(c); }
bool is_space(char c) noexcept { return c == ' ' || c == '\t'; }

std::optional<uint32_t> parse_hex4(std::string_view s) noexcept
{
  if (s.size() < 4) {
    return std::nullopt;
  }
  uint32_t cp = 0;
  for (size_t i = 0; i < 4; ++i) {
    const char c = s[i];
    cp <<= 4;
    if (c >= '0' && c <= '9') {
      cp |= static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      cp |= static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      cp |= static_cast<uint32_t>(c - 'A' + 10);
    } else {
      return std::nullopt;
    }
  }
  if (cp >= 0xD800 && cp <= 0xDFFF) {
    return std::nullopt;
  }
  return cp;
}

void append_utf8(std::string & out, uint32_t cp)
{
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

// Reads a quoted string starting at src[pos] == '"'. On success `pos` points
// just past the closing quote.
bool read_quoted(std::string_view src, size_t & pos, std::string & out, std::string & error)
{
  ++pos;  // opening quote
  while (pos < src.size()) {
    const char c = src[pos];
    if (c == '"') {
      if (pos + 1 < src.size() && src[pos + 1] == '"') {
        out += '"';
        pos += 2;
        continue;
      }
      ++pos;
      return true;
    }
    if (c == '\\' && pos + 1 < src.size()) {
      const char e = src[pos + 1];
      switch (e) {
        case 'n':
          out += '\n';
          break;
        case 't':
          out += '\t';
          break;
        case 'r':
          out += '\r';
          break;
        case '\\':
          out += '\\';
          break;
        case '"':
          out += '"';
          break;
        case 'u':
          if (auto cp = parse_hex4(src.substr(pos + 2))) {
            append_utf8(out, *cp);
            pos += 6;
            continue;
          }
          out += "\\u";
          break;
        default:
          out += '\\';
          out += e;
          break;
      }
      pos += 2;
      continue;
    }
    out += c;
    ++pos;
  }
  error = "unterminated quoted string";
  return false;
}

}  // namespace

// ============================================================================
// Token predicates
// ============================================================================

bool is_key_token(std::string_view s) noexcept
{
  if (s.empty() || !is_lower_or_underscore(s[0])) {
    return false;
  }
  for (const char c : s.substr(1)) {
    if (!is_lower_or_underscore(c) && !is_digit(c)) {
      return false;
    }
  }
  return true;
}

bool is_id_token(std::string_view s) noexcept
{
  if (s.empty() || !is_alpha(s[0])) {
    return false;
  }
  for (const char c : s.substr(1)) {
    if (!is_alpha(c) && !is_digit(c) && c != '-') {
      return false;
    }
  }
  return true;
}

bool is_type_name(std::string_view s) noexcept
{
  if (s.empty() || !is_upper(s[0])) {
    return false;
  }
  for (const char c : s.substr(1)) {
    if (!is_alpha(c) && !is_digit(c)) {
      return false;
    }
  }
  return true;
}

std::string_view trim(std::string_view s) noexcept
{
  size_t b = 0;
  while (b < s.size() && is_space(s[b])) {
    ++b;
  }
  return trim_end(s.substr(b));
}

std::string_view trim_end(std::string_view s) noexcept
{
  size_t e = s.size();
  while (e > 0 && is_space(s[e - 1])) {
    --e;
  }
  return s.substr(0, e);
}

std::string_view strip_comment(std::string_view line) noexcept
{
  bool in_quote = false;
  int expr_depth = 0;
  for (size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (in_quote) {
      if (c == '\\') {
        ++i;
      } else if (c == '"') {
        in_quote = false;
      }
      continue;
    }
    if (c == '"') {
      in_quote = true;
    } else if (expr_depth > 0) {
      if (c == '(') {
        ++expr_depth;
      } else if (c == ')') {
        --expr_depth;
      }
    } else if (c == '$' && i + 1 < line.size() && line[i + 1] == '(') {
      expr_depth = 1;
      ++i;
    } else if (c == '#') {
      return trim_end(line.substr(0, i));
    }
  }
  return trim_end(line);
}

// ============================================================================
// Scanner
// ============================================================================

bool Scanner::starts_with(std::string_view s) const noexcept
{
  return src_.substr(pos_, s.size()) == s;
}

void Scanner::skip_spaces() noexcept
{
  while (!eof() && is_space(src_[pos_])) {
    ++pos_;
  }
}

bool Scanner::match(char c) noexcept
{
  if (!eof() && src_[pos_] == c) {
    ++pos_;
    return true;
  }
  return false;
}

// ============================================================================
// Quoted strings and row cells
// ============================================================================

Result<std::string> parse_quoted(std::string_view text, size_t line)
{
  const std::string_view t = trim(text);
  if (t.empty() || t[0] != '"') {
    return Result<std::string>::fail(HedlError::syntax("expected quoted string", line));
  }

  size_t pos = 0;
  std::string out;
  std::string error;
  if (!read_quoted(t, pos, out, error)) {
    return Result<std::string>::fail(HedlError::syntax(error, line));
  }
  if (pos != t.size()) {
    return Result<std::string>::fail(HedlError::syntax(
      fmt::format("unexpected characters after quoted string: '{}'", t.substr(pos)), line));
  }
  return Result<std::string>::ok(std::move(out));
}

Result<std::vector<RowCell>> split_row_cells(std::string_view row, size_t line)
{
  using R = Result<std::vector<RowCell>>;

  std::vector<RowCell> cells;
  if (trim(row).empty()) {
    return R::ok(std::move(cells));
  }

  const size_t n = row.size();
  size_t pos = 0;
  while (true) {
    while (pos < n && is_space(row[pos])) {
      ++pos;
    }

    if (pos < n && row[pos] == '"') {
      RowCell cell;
      cell.quoted = true;
      std::string error;
      if (!read_quoted(row, pos, cell.text, error)) {
        return R::fail(HedlError::syntax(error, line));
      }
      while (pos < n && is_space(row[pos])) {
        ++pos;
      }
      if (pos < n && row[pos] != ',') {
        return R::fail(HedlError::syntax(
          fmt::format("unexpected characters after quoted cell at column {}", pos + 1), line));
      }
      cells.push_back(std::move(cell));
    } else {
      const size_t start = pos;
      bool in_quote = false;
      int expr_depth = 0;
      int bracket_depth = 0;
      for (; pos < n; ++pos) {
        const char c = row[pos];
        if (in_quote) {
          if (c == '\\') {
            ++pos;
          } else if (c == '"') {
            in_quote = false;
          }
          continue;
        }
        if (expr_depth > 0) {
          if (c == '"') {
            in_quote = true;
          } else if (c == '(') {
            ++expr_depth;
          } else if (c == ')') {
            --expr_depth;
          }
          continue;
        }
        if (c == '$' && pos + 1 < n && row[pos + 1] == '(') {
          expr_depth = 1;
          ++pos;
        } else if (c == '[') {
          ++bracket_depth;
        } else if (c == ']' && bracket_depth > 0) {
          --bracket_depth;
        } else if (c == ',' && bracket_depth == 0) {
          break;
        } else if (c == '"') {
          return R::fail(HedlError::syntax(
            fmt::format("unexpected quote in unquoted cell at column {}", pos + 1), line));
        }
      }
      if (in_quote || expr_depth > 0) {
        return R::fail(HedlError::syntax("unterminated expression in row", line));
      }
      if (bracket_depth > 0) {
        return R::fail(HedlError::syntax("unclosed '[' in row", line));
      }
      RowCell cell;
      cell.text = std::string(trim(row.substr(start, pos - start)));
      cells.push_back(std::move(cell));
    }

    if (pos >= n) {
      break;
    }
    ++pos;  // ','
    if (trim(row.substr(pos)).empty()) {
      return R::fail(HedlError::syntax("trailing comma in row", line));
    }
  }

  return R::ok(std::move(cells));
}

}  // namespace hedl::syntax
