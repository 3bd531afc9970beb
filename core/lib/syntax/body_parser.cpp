// hedl/syntax/body_parser.cpp - Body parsing implementation
#include "hedl/syntax/body_parser.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <charconv>
#include <system_error>
#include <utility>

#include "hedl/syntax/lexer.hpp"
#include "hedl/syntax/schema.hpp"
#include "hedl/syntax/value_parser.hpp"

namespace hedl::syntax
{

namespace
{

constexpr std::string_view k_block_quote = R"(""")";

bool is_word_char(char c) noexcept
{
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

std::optional<size_t> parse_count(std::string_view digits)
{
  if (digits.empty()) {
    return std::nullopt;
  }
  size_t v = 0;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), v);
  if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
    return std::nullopt;
  }
  return v;
}

size_t leading_spaces(std::string_view s) noexcept
{
  size_t n = 0;
  while (n < s.size() && s[n] == ' ') {
    ++n;
  }
  return n;
}

}  // namespace

Status BodyParser::parse(size_t first_line)
{
  stack_.clear();
  Frame root;
  root.kind = FrameKind::Root;
  root.object = &doc_.root;
  stack_.push_back(root);

  for (size_t i = first_line; i < src_.line_count(); ++i) {
    if (!process_line(src_.get_line(i), i + 1)) {
      return Status::fail(std::move(*error_));
    }
  }

  if (block_) {
    return Status::fail(HedlError::syntax(
      fmt::format("unterminated block string for key '{}'", block_->key), block_->start_line));
  }

  stack_.clear();
  return Status::ok();
}

bool BodyParser::process_line(std::string_view raw, size_t line)
{
  if (block_) {
    return process_block_line(raw, line);
  }

  const std::string_view t = trim(raw);
  if (t.empty() || t[0] == '#') {
    return true;
  }

  const size_t spaces = leading_spaces(raw);
  if (raw[spaces] == '\t') {
    return fail(HedlError::syntax("tab character in indentation, use two spaces per level", line));
  }
  if (spaces % 2 != 0) {
    return fail(HedlError::syntax(
      fmt::format("indentation must be a multiple of 2 spaces, found {}", spaces), line));
  }

  const size_t indent = spaces / 2;
  if (indent > limits_.max_indent_depth) {
    return fail(HedlError::security(
      fmt::format(
        "indentation depth {} exceeds maximum allowed depth {}", indent,
        limits_.max_indent_depth),
      line));
  }

  // Close frames this line no longer belongs to
  while (stack_.size() > 1) {
    const Frame & top = stack_.back();
    const bool closes = (top.kind == FrameKind::Object && indent <= top.indent) ||
                        (top.kind == FrameKind::List && indent < top.row_indent);
    if (!closes) {
      break;
    }
    stack_.pop_back();
  }

  const std::string_view content = raw.substr(spaces);
  if (content[0] == '|') {
    return parse_row_line(strip_comment(content), indent, line);
  }
  return parse_key_line(content, indent, line);
}

bool BodyParser::process_block_line(std::string_view raw, size_t line)
{
  const std::string_view t = trim(raw);
  if (t == k_block_quote) {
    Value text = Value::make_string(std::move(block_->content));
    block_->object->emplace(std::move(block_->key), Item(std::move(text)));
    block_.reset();
    return true;
  }
  if (raw.find(k_block_quote) != std::string_view::npos) {
    return fail(HedlError::syntax(
      "closing '\"\"\"' of a block string must be on its own line", line));
  }

  const size_t strip = std::min(leading_spaces(raw), block_->strip);
  const std::string_view piece = raw.substr(strip);
  const size_t added = piece.size() + (block_->first ? 0 : 1);
  if (block_->size + added > limits_.max_block_string_size) {
    return fail(HedlError::security(
      fmt::format(
        "block string size {} exceeds limit {}", block_->size + added,
        limits_.max_block_string_size),
      line));
  }

  if (!block_->first) {
    block_->content += '\n';
  }
  block_->content.append(piece.data(), piece.size());
  block_->size += added;
  block_->first = false;
  return true;
}

bool BodyParser::parse_key_line(std::string_view content, size_t indent, size_t line)
{
  const Frame & top = stack_.back();
  if (top.kind == FrameKind::List) {
    return fail(HedlError::syntax(
      fmt::format("expected a '|' row inside matrix list of '{}'", top.type_name), line));
  }

  const size_t expected = (top.kind == FrameKind::Root) ? 0 : top.indent + 1;
  if (indent != expected) {
    return fail(HedlError::syntax(
      fmt::format("unexpected indentation: expected {} spaces, found {}", expected * 2, indent * 2),
      line));
  }

  const size_t colon = content.find(':');
  if (colon == std::string_view::npos) {
    return fail(HedlError::syntax(
      fmt::format("expected 'key: value', found '{}'", strip_comment(content)), line));
  }

  // key or key(N)
  std::string_view key_part = trim(content.substr(0, colon));
  std::optional<size_t> count_hint;
  if (!key_part.empty() && key_part.back() == ')') {
    const size_t open = key_part.find('(');
    if (open == std::string_view::npos) {
      return fail(HedlError::syntax(fmt::format("invalid key '{}'", key_part), line));
    }
    count_hint = parse_count(trim(key_part.substr(open + 1, key_part.size() - open - 2)));
    if (!count_hint || *count_hint == 0) {
      return fail(HedlError::syntax(
        fmt::format("invalid count hint in '{}': expected a positive integer", key_part), line));
    }
    key_part = trim(key_part.substr(0, open));
  }
  if (!is_key_token(key_part)) {
    return fail(HedlError::syntax(
      fmt::format("invalid key '{}': expected [a-z_][a-z0-9_]*", key_part), line));
  }
  const std::string key(key_part);

  const std::string_view after = content.substr(colon + 1);
  if (!after.empty() && after[0] != ' ') {
    return fail(HedlError::syntax(fmt::format("missing space after ':' for key '{}'", key), line));
  }
  const std::string_view value_raw = trim(after);
  Object & target = *top.object;

  // Block string opener
  if (value_raw.substr(0, 3) == k_block_quote) {
    const std::string_view rest = trim(value_raw.substr(3));
    if (rest.empty() || rest[0] == '#') {
      if (count_hint) {
        return fail(HedlError::syntax("count hint is only allowed on matrix lists", line));
      }
      if (!claim_key(target, key, line)) {
        return false;
      }
      BlockString block;
      block.object = &target;
      block.key = key;
      block.start_line = line;
      block.strip = (indent + 1) * 2;
      block_ = std::move(block);
      return true;
    }
  }

  const std::string_view value = strip_comment(value_raw);

  // Nested object
  if (value.empty()) {
    if (count_hint) {
      return fail(HedlError::syntax("count hint is only allowed on matrix lists", line));
    }
    if (!claim_key(target, key, line)) {
      return false;
    }
    auto it = target.emplace(key, Item(Object{})).first;
    Frame frame;
    frame.kind = FrameKind::Object;
    frame.indent = indent;
    frame.object = &it->second.as_object();
    stack_.push_back(frame);
    return true;
  }

  // Matrix list: @Type with a declared struct, or @Type[cols]
  if (value[0] == '@') {
    const std::string_view type = Scanner(value.substr(1)).take_while(is_word_char);
    const std::string_view rest = value.substr(1 + type.size());
    const bool inline_schema = !rest.empty() && rest[0] == '[';
    if (is_type_name(type) && (inline_schema || (rest.empty() && doc_.get_schema(type)))) {
      return start_list(target, key, value.substr(1), count_hint, indent, line);
    }
  }

  if (count_hint) {
    return fail(HedlError::syntax("count hint is only allowed on matrix lists", line));
  }

  Value scalar;
  if (value[0] == '"') {
    auto s = parse_quoted(value, line);
    if (!s) {
      return fail(s.error());
    }
    if (s.value().size() > limits_.max_block_string_size) {
      return fail(HedlError::security(
        fmt::format(
          "string size {} exceeds limit {}", s.value().size(), limits_.max_block_string_size),
        line));
    }
    scalar = Value::make_string(std::move(s).value());
  } else {
    auto v = infer_value(value, doc_.aliases, line);
    if (!v) {
      return fail(v.error());
    }
    scalar = std::move(v).value();
  }

  if (!claim_key(target, key, line)) {
    return false;
  }
  target.emplace(key, Item(std::move(scalar)));
  return true;
}

bool BodyParser::start_list(
  Object & target, const std::string & key, std::string_view decl,
  std::optional<size_t> count_hint, size_t indent, size_t line)
{
  const size_t bracket = decl.find('[');
  const std::string type(decl.substr(0, bracket));

  if (bracket != std::string_view::npos) {
    auto columns = parse_schema_columns(decl.substr(bracket), limits_, line);
    if (!columns) {
      return fail(columns.error());
    }
    const auto * declared = doc_.get_schema(type);
    if (declared == nullptr) {
      doc_.structs.emplace(type, std::move(columns).value());
    } else if (*declared != columns.value()) {
      return fail(HedlError::schema(
        fmt::format("inline schema for '{}' does not match its %STRUCT declaration", type), line));
    }
  }

  const auto * schema = doc_.get_schema(type);
  if (schema == nullptr) {
    return fail(HedlError::schema(fmt::format("undefined struct '{}'", type), line));
  }
  if (!claim_key(target, key, line)) {
    return false;
  }

  MatrixList list(type, *schema);
  list.count_hint = count_hint;
  auto it = target.emplace(key, Item(std::move(list))).first;

  Frame frame;
  frame.kind = FrameKind::List;
  frame.indent = indent;
  frame.rows = &it->second.as_list().rows;
  frame.type_name = type;
  frame.schema = schema;
  frame.row_indent = indent + 1;
  frame.nest_depth = 0;
  stack_.push_back(std::move(frame));
  return true;
}

bool BodyParser::parse_row_line(std::string_view content, size_t indent, size_t line)
{
  Frame & top = stack_.back();
  if (top.kind != FrameKind::List) {
    return fail(HedlError::syntax("matrix row '|' outside of a matrix list", line));
  }

  if (indent == top.row_indent) {
    return add_row(top, content.substr(1), line);
  }

  if (indent != top.row_indent + 1) {
    return fail(HedlError::syntax(
      fmt::format(
        "unexpected row indentation: expected {} spaces, found {}", top.row_indent * 2,
        indent * 2),
      line));
  }

  // Row nested beneath the previous row of the enclosing list
  const std::string * child_type = doc_.get_child_type(top.type_name);
  if (child_type == nullptr) {
    return fail(HedlError::syntax(
      fmt::format("indented row under '{}' but no %NEST rule declares its children", top.type_name),
      line));
  }
  if (top.rows->empty()) {
    return fail(HedlError::orphan_row(
      fmt::format("'{}' row has no parent '{}' row", *child_type, top.type_name), line));
  }

  const size_t depth = top.nest_depth + 1;
  if (depth > limits_.max_nest_depth) {
    return fail(HedlError::security(
      fmt::format(
        "NEST hierarchy depth {} exceeds maximum allowed depth {}", depth,
        limits_.max_nest_depth),
      line));
  }

  Frame child;
  child.kind = FrameKind::List;
  child.indent = top.row_indent;
  child.rows = &top.rows->back().children[*child_type];
  child.type_name = *child_type;
  child.schema = doc_.get_schema(*child_type);
  child.row_indent = top.row_indent + 1;
  child.nest_depth = depth;
  if (child.schema == nullptr) {
    return fail(HedlError::schema(fmt::format("undefined struct '{}'", *child_type), line));
  }

  stack_.push_back(std::move(child));
  return add_row(stack_.back(), content.substr(1), line);
}

bool BodyParser::add_row(Frame & frame, std::string_view row, size_t line)
{
  std::optional<size_t> child_count;
  if (!row.empty() && row[0] == '[') {
    const size_t close = row.find(']');
    if (close != std::string_view::npos) {
      child_count = parse_count(row.substr(1, close - 1));
    }
    if (!child_count) {
      return fail(HedlError::syntax("invalid child count prefix, expected '|[N]'", line));
    }
    row = row.substr(close + 1);
  }

  auto cells_result = split_row_cells(row, line);
  if (!cells_result) {
    return fail(cells_result.error());
  }
  const auto & cells = cells_result.value();

  const auto & schema = *frame.schema;
  if (cells.size() != schema.size() + 1) {
    HedlError err = HedlError::shape(
      fmt::format(
        "row has {} cells, expected {} (id + {} columns) for type '{}'", cells.size(),
        schema.size() + 1, schema.size(), frame.type_name),
      line);
    if (!schema.empty() && schema.front() == "id") {
      err.with_help("the id column is implicit; remove 'id' from the schema");
    }
    return fail(std::move(err));
  }

  if (node_count_ >= limits_.max_nodes) {
    return fail(HedlError::security(
      fmt::format("too many nodes: exceeds limit of {}", limits_.max_nodes), line));
  }

  const RowCell & id_cell = cells.front();
  if (!id_cell.quoted && id_cell.text == "~") {
    return fail(HedlError::semantic("null '~' is not allowed in the id column", line));
  }
  if (!id_cell.quoted && id_cell.text == "^") {
    return fail(HedlError::semantic("ditto '^' is not allowed in the id column", line));
  }
  if (!is_id_token(id_cell.text)) {
    return fail(HedlError::semantic(fmt::format("invalid id '{}'", id_cell.text), line));
  }

  std::vector<Value> fields;
  fields.reserve(schema.size());
  for (size_t i = 1; i < cells.size(); ++i) {
    const RowCell & cell = cells[i];
    if (cell.quoted) {
      fields.push_back(Value::make_string(cell.text));
      continue;
    }
    if (cell.text == "^") {
      if (frame.rows->empty()) {
        return fail(HedlError::semantic(
          fmt::format("ditto '^' in column '{}' is not allowed in the first row", schema[i - 1]),
          line));
      }
      fields.push_back(frame.rows->back().fields[i - 1]);
      continue;
    }
    auto v = infer_value(cell.text, doc_.aliases, line);
    if (!v) {
      return fail(v.error());
    }
    fields.push_back(std::move(v).value());
  }

  Node node(frame.type_name, id_cell.text, std::move(fields));
  node.child_count = child_count;
  node.line = line;
  ++node_count_;
  frame.rows->push_back(std::move(node));
  return true;
}

bool BodyParser::claim_key(const Object & target, const std::string & key, size_t line)
{
  if (target.find(key) != target.end()) {
    return fail(HedlError::syntax(fmt::format("duplicate key '{}'", key), line));
  }
  if (target.size() >= limits_.max_object_keys) {
    return fail(HedlError::security(
      fmt::format("object has too many keys: exceeds limit of {}", limits_.max_object_keys),
      line));
  }
  if (total_keys_ >= limits_.max_total_keys) {
    return fail(HedlError::security(
      fmt::format("too many keys in document: exceeds limit of {}", limits_.max_total_keys),
      line));
  }
  ++total_keys_;
  return true;
}

}  // namespace hedl::syntax
