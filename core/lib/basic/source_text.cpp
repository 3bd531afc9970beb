// hedl/basic/source_text.cpp - Line table implementation
#include "hedl/basic/source_text.hpp"

#include <algorithm>
#include <utility>

namespace hedl
{

SourceText::SourceText(std::string content) : content_(std::move(content)) { build_line_table(); }

std::string_view SourceText::get_line(size_t line_index) const noexcept
{
  if (line_index >= line_count_) {
    return {};
  }

  const size_t start = line_offsets_[line_index];
  size_t end = content_.size();
  if (line_index + 1 < line_offsets_.size()) {
    end = line_offsets_[line_index + 1];
    if (end > start && content_[end - 1] == '\n') {
      --end;
    }
  }

  return std::string_view(content_).substr(start, end - start);
}

size_t SourceText::line_of_offset(size_t offset) const noexcept
{
  if (line_offsets_.empty()) {
    return 1;
  }
  offset = std::min(offset, content_.size());
  auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
  return static_cast<size_t>(it - line_offsets_.begin());
}

void SourceText::build_line_table()
{
  line_offsets_.clear();
  line_offsets_.push_back(0);

  for (size_t i = 0; i < content_.size(); ++i) {
    if (content_[i] == '\n') {
      line_offsets_.push_back(i + 1);
    }
  }

  line_count_ = line_offsets_.size();
  if (content_.empty() || content_.back() == '\n') {
    --line_count_;
  }
}

}  // namespace hedl
