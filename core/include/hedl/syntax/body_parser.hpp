// hedl/syntax/body_parser.hpp - Indentation-driven builder for the document body
//
// The body is processed line by line against an explicit frame stack:
//   - Root/Object frames receive `key: value`, `key:` and `key: @Type` lines
//   - List frames receive `|` rows; a row one level deeper than the list's
//     rows opens a child List frame when the row type has a %NEST rule
// Every descent is checked against Limits before it happens.
//
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "hedl/basic/error.hpp"
#include "hedl/basic/limits.hpp"
#include "hedl/basic/source_text.hpp"
#include "hedl/model/document.hpp"

namespace hedl::syntax
{

class BodyParser
{
public:
  BodyParser(const SourceText & src, const Limits & limits, Document & doc)
  : src_(src), limits_(limits), doc_(doc)
  {
  }

  /// Parse body lines starting at 0-based line index `first_line`
  [[nodiscard]] Status parse(size_t first_line);

private:
  enum class FrameKind : uint8_t {
    Root,
    Object,
    List,
  };

  struct Frame
  {
    FrameKind kind = FrameKind::Root;

    /// Indent level of the key that opened an Object or List frame
    size_t indent = 0;

    /// Target of key lines (Root/Object)
    Object * object = nullptr;

    // List frames
    std::vector<Node> * rows = nullptr;
    std::string type_name;
    const std::vector<std::string> * schema = nullptr;
    size_t row_indent = 0;
    size_t nest_depth = 0;
  };

  struct BlockString
  {
    Object * object = nullptr;
    std::string key;
    size_t start_line = 0;
    size_t strip = 0;  ///< Leading spaces removed from each content line
    size_t size = 0;
    std::string content;
    bool first = true;
  };

  bool process_line(std::string_view raw, size_t line);
  bool process_block_line(std::string_view raw, size_t line);

  bool parse_key_line(std::string_view content, size_t indent, size_t line);
  bool parse_row_line(std::string_view content, size_t indent, size_t line);

  bool start_list(
    Object & target, const std::string & key, std::string_view decl,
    std::optional<size_t> count_hint, size_t indent, size_t line);

  bool add_row(Frame & frame, std::string_view row, size_t line);

  /// Reserve `key` in `target`, enforcing duplicate and key-count rules
  bool claim_key(const Object & target, const std::string & key, size_t line);

  bool fail(HedlError error)
  {
    error_ = std::move(error);
    return false;
  }

  const SourceText & src_;
  const Limits & limits_;
  Document & doc_;

  std::vector<Frame> stack_;
  std::optional<BlockString> block_;

  size_t node_count_ = 0;
  size_t total_keys_ = 0;
  std::optional<HedlError> error_;
};

}  // namespace hedl::syntax
