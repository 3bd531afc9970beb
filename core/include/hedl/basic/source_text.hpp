// hedl/basic/source_text.hpp - Normalized input text with a line table
//
// Holds the document text after preprocessing (BOM stripped, LF line
// endings) and provides O(1) access to individual lines.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace hedl
{

class SourceText
{
public:
  SourceText() = default;
  explicit SourceText(std::string content);

  [[nodiscard]] const std::string & content() const noexcept { return content_; }

  /// Number of lines (a trailing newline does not open a new line)
  [[nodiscard]] size_t line_count() const noexcept { return line_count_; }

  /// Line text without its newline (0-based index; empty when out of range)
  [[nodiscard]] std::string_view get_line(size_t line_index) const noexcept;

  /// 1-based line number containing a byte offset
  [[nodiscard]] size_t line_of_offset(size_t offset) const noexcept;

private:
  void build_line_table();

  std::string content_;
  std::vector<size_t> line_offsets_;
  size_t line_count_ = 0;
};

}  // namespace hedl
