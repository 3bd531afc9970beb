// hedl/syntax/preprocess.cpp - Input validation and normalization
#include "hedl/syntax/preprocess.hpp"

#include <fmt/core.h>

#include <cstdint>
#include <string>

namespace hedl::syntax
{

namespace
{

constexpr std::string_view k_utf8_bom = "\xEF\xBB\xBF";

size_t count_lines_before(std::string_view text, size_t offset) noexcept
{
  size_t line = 1;
  for (size_t i = 0; i < offset && i < text.size(); ++i) {
    if (text[i] == '\n') {
      ++line;
    }
  }
  return line;
}

}  // namespace

size_t valid_utf8_prefix(std::string_view bytes) noexcept
{
  size_t i = 0;
  while (i < bytes.size()) {
    const auto c = static_cast<unsigned char>(bytes[i]);
    size_t len = 0;
    uint32_t cp = 0;
    if (c < 0x80) {
      ++i;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      len = 2;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      cp = c & 0x07;
    } else {
      return i;
    }
    if (i + len > bytes.size()) {
      return i;
    }
    for (size_t k = 1; k < len; ++k) {
      const auto cc = static_cast<unsigned char>(bytes[i + k]);
      if ((cc & 0xC0) != 0x80) {
        return i;
      }
      cp = (cp << 6) | (cc & 0x3F);
    }
    // Overlong encodings, surrogates and out-of-range code points
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
        (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
      return i;
    }
    i += len;
  }
  return i;
}

Result<SourceText> preprocess(std::string_view bytes, const Limits & limits)
{
  using R = Result<SourceText>;

  if (bytes.size() > limits.max_file_size) {
    return R::fail(HedlError::security(
      fmt::format("file too large: exceeds limit of {} bytes", limits.max_file_size)));
  }

  const size_t valid = valid_utf8_prefix(bytes);
  if (valid != bytes.size()) {
    return R::fail(HedlError::syntax(
      fmt::format("invalid UTF-8 encoding at byte offset {}", valid),
      count_lines_before(bytes, valid)));
  }

  if (bytes.substr(0, k_utf8_bom.size()) == k_utf8_bom) {
    bytes.remove_prefix(k_utf8_bom.size());
  }

  std::string text;
  text.reserve(bytes.size());
  size_t line = 1;
  size_t line_len = 0;
  for (size_t i = 0; i < bytes.size(); ++i) {
    const char c = bytes[i];
    if (c == '\r') {
      if (i + 1 < bytes.size() && bytes[i + 1] == '\n') {
        continue;
      }
      return R::fail(HedlError::syntax("bare CR (U+000D) not allowed, use LF or CRLF", line));
    }
    if (c == '\n') {
      text += '\n';
      ++line;
      line_len = 0;
      continue;
    }
    if (static_cast<unsigned char>(c) < 0x20 && c != '\t') {
      return R::fail(HedlError::syntax(
        fmt::format("control character U+{:04X} not allowed", static_cast<unsigned>(c)), line));
    }
    if (++line_len > limits.max_line_length) {
      return R::fail(HedlError::security(
        fmt::format("line too long: exceeds limit of {} bytes", limits.max_line_length), line));
    }
    text += c;
  }

  return R::ok(SourceText(std::move(text)));
}

}  // namespace hedl::syntax
