// hedl/canonical/canonical_writer.cpp - Canonical serialization
//
// Uses fmt for number formatting and output assembly.
//
#include "hedl/canonical/canonical_writer.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

#include <cmath>
#include <iterator>
#include <ostream>
#include <utility>

#include "hedl/canonical/ditto.hpp"
#include "hedl/syntax/value_parser.hpp"

namespace hedl
{

namespace
{

constexpr std::string_view k_block_quote = R"(""")";

std::string indent_str(size_t indent) { return std::string(indent * 2, ' '); }

bool is_control(char c) noexcept
{
  const auto u = static_cast<unsigned char>(c);
  return u < 0x20 || u == 0x7F;
}

std::string format_float(double d)
{
  if (std::isfinite(d) && d == std::trunc(d)) {
    return fmt::format("{:.1f}", d);
  }
  return fmt::format("{}", d);
}

std::string format_tensor(const Tensor & t)
{
  if (t.is_scalar()) {
    return format_float(t.scalar_value());
  }
  std::string out = "[";
  for (size_t i = 0; i < t.elements().size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += format_tensor(t.elements()[i]);
  }
  out += ']';
  return out;
}

std::string join_columns(const std::vector<std::string> & cols)
{
  std::string out;
  for (size_t i = 0; i < cols.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += cols[i];
  }
  return out;
}

// Multi-line strings in key-value position are written as """ blocks
bool use_block_form(std::string_view s)
{
  if (s.find('\n') == std::string_view::npos || s.find(k_block_quote) != std::string_view::npos) {
    return false;
  }
  for (const char c : s) {
    if (is_control(c) && c != '\n' && c != '\t') {
      return false;
    }
  }
  return true;
}

// Shared formatting of non-string values
std::string format_non_string(const Value & value)
{
  switch (value.kind()) {
    case ValueKind::Null:
      return "~";
    case ValueKind::Bool:
      return value.as_bool() ? "true" : "false";
    case ValueKind::Int:
      return fmt::format("{}", value.as_int());
    case ValueKind::Float:
      return format_float(value.as_float());
    case ValueKind::Reference:
      return value.as_reference().to_ref_string();
    case ValueKind::Tensor:
      return format_tensor(value.as_tensor());
    case ValueKind::Expression:
      return "$(" + value.as_string() + ")";
    case ValueKind::String:
      break;
  }
  return value.as_string();
}

}  // namespace

// ============================================================================
// Quoting helpers
// ============================================================================

bool needs_quoting_scalar(std::string_view s)
{
  if (s.empty()) {
    return true;
  }
  const char first = s.front();
  const char last = s.back();
  if (first == ' ' || first == '\t' || last == ' ' || last == '\t') {
    return true;
  }
  if (first == '~' || first == '@' || first == '$' || first == '%' || first == '[') {
    return true;
  }
  if (s == "true" || s == "false") {
    return true;
  }
  for (const char c : s) {
    if (c == '#' || c == '"' || is_control(c)) {
      return true;
    }
  }
  return syntax::try_parse_number(s).has_value();
}

bool needs_quoting_cell(std::string_view s)
{
  if (needs_quoting_scalar(s) || s.front() == '^') {
    return true;
  }
  for (const char c : s) {
    if (c == ',' || c == '|' || c == '[' || c == ']') {
      return true;
    }
  }
  return s.find("$(") != std::string_view::npos;
}

std::string quote_string(std::string_view s)
{
  std::string out;
  out.reserve(s.size() + 2);
  out += '"';
  for (const char c : s) {
    switch (c) {
      case '"':
        out += "\"\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\t':
        out += "\\t";
        break;
      case '\r':
        out += "\\r";
        break;
      default:
        if (is_control(c)) {
          out += fmt::format("\\u{:04X}", static_cast<unsigned>(static_cast<unsigned char>(c)));
        } else {
          out += c;
        }
        break;
    }
  }
  out += '"';
  return out;
}

// ============================================================================
// CanonicalWriter
// ============================================================================

Result<std::string> CanonicalWriter::write(const Document & doc)
{
  doc_ = &doc;
  out_.clear();
  error_.reset();
  structs_.clear();
  counts_.clear();

  for (const auto & [type, cols] : doc.structs) {
    structs_.emplace(type, cols);
  }
  collect_structs(doc.root);

  write_header(doc);
  if (!write_object(doc.root, 0)) {
    doc_ = nullptr;
    return Result<std::string>::fail(std::move(*error_));
  }

  doc_ = nullptr;
  return Result<std::string>::ok(std::move(out_));
}

std::string CanonicalWriter::format_scalar(const Value & value) const
{
  if (!value.is_string()) {
    return format_non_string(value);
  }
  const std::string & s = value.as_string();
  if (config_.quoting == QuotingStrategy::Always || needs_quoting_scalar(s)) {
    return quote_string(s);
  }
  return s;
}

std::string CanonicalWriter::format_cell(const Value & value) const
{
  if (!value.is_string()) {
    return format_non_string(value);
  }
  const std::string & s = value.as_string();
  if (config_.quoting == QuotingStrategy::Always || needs_quoting_cell(s)) {
    return quote_string(s);
  }
  return s;
}

// ----------------------------------------------------------------------------
// Header
// ----------------------------------------------------------------------------

void CanonicalWriter::collect_structs(const Object & object)
{
  for (const auto & [key, item] : object) {
    if (item.is_object()) {
      collect_structs(item.as_object());
    } else if (item.is_list()) {
      const MatrixList & list = item.as_list();
      structs_.emplace(list.type_name, list.schema);
      counts_[list.type_name];
      collect_rows(list.rows);
    }
  }
}

void CanonicalWriter::collect_rows(const std::vector<Node> & rows)
{
  for (const Node & node : rows) {
    ++counts_[node.type_name];
    for (const auto & [child_type, children] : node.children) {
      collect_rows(children);
    }
  }
}

void CanonicalWriter::write_header(const Document & doc)
{
  auto out = std::back_inserter(out_);

  fmt::format_to(out, "%VERSION: {}.{}\n", doc.version.first, doc.version.second);

  for (const auto & [name, value] : doc.aliases) {
    fmt::format_to(out, "%ALIAS {} = {}\n", name, quote_string(value));
  }

  for (const auto & [type, cols] : structs_) {
    auto count = counts_.find(type);
    if (config_.emit_counts && count != counts_.end() && count->second > 0) {
      fmt::format_to(out, "%STRUCT: {} ({}): [{}]\n", type, count->second, join_columns(cols));
    } else {
      fmt::format_to(out, "%STRUCT: {}: [{}]\n", type, join_columns(cols));
    }
  }

  for (const auto & [parent, child] : doc.nests) {
    fmt::format_to(out, "%NEST {} > {}\n", parent, child);
  }

  out_ += "---\n";
}

// ----------------------------------------------------------------------------
// Body
// ----------------------------------------------------------------------------

bool CanonicalWriter::check_depth(size_t indent)
{
  if (indent > config_.max_depth) {
    error_ = HedlError::security(fmt::format(
      "nesting depth {} exceeds maximum allowed depth {}", indent, config_.max_depth));
    return false;
  }
  return true;
}

bool CanonicalWriter::write_object(const Object & object, size_t indent)
{
  if (!check_depth(indent)) {
    return false;
  }

  for (const auto & [key, item] : object) {
    switch (item.kind()) {
      case ItemKind::Scalar:
        if (!write_scalar(key, item.as_scalar(), indent)) {
          return false;
        }
        break;
      case ItemKind::Object:
        fmt::format_to(std::back_inserter(out_), "{}{}:\n", indent_str(indent), key);
        if (!write_object(item.as_object(), indent + 1)) {
          return false;
        }
        break;
      case ItemKind::List:
        if (!write_list(key, item.as_list(), indent)) {
          return false;
        }
        break;
    }
  }
  return true;
}

bool CanonicalWriter::write_scalar(const std::string & key, const Value & value, size_t indent)
{
  const std::string ind = indent_str(indent);

  if (
    value.is_string() && config_.quoting == QuotingStrategy::Minimal &&
    use_block_form(value.as_string())) {
    const std::string inner = indent_str(indent + 1);
    fmt::format_to(std::back_inserter(out_), "{}{}: {}\n", ind, key, k_block_quote);

    std::string_view rest = value.as_string();
    while (true) {
      const size_t nl = rest.find('\n');
      const std::string_view line = rest.substr(0, nl);
      if (!line.empty()) {
        out_ += inner;
        out_.append(line.data(), line.size());
      }
      out_ += '\n';
      if (nl == std::string_view::npos) {
        break;
      }
      rest.remove_prefix(nl + 1);
    }

    fmt::format_to(std::back_inserter(out_), "{}{}\n", inner, k_block_quote);
    return true;
  }

  // `key: @Name` reads back as a list when Name is a struct
  if (value.is_reference()) {
    const Reference & ref = value.as_reference();
    if (!ref.type_name && structs_.count(ref.id) > 0) {
      error_ = HedlError::reference(fmt::format(
        "reference '@{}' under key '{}' collides with struct '{}' and would be read back as a "
        "list; qualify it as '@Type:{}'",
        ref.id, key, ref.id, ref.id));
      return false;
    }
  }

  fmt::format_to(std::back_inserter(out_), "{}{}: {}\n", ind, key, format_scalar(value));
  return true;
}

bool CanonicalWriter::write_list(const std::string & key, const MatrixList & list, size_t indent)
{
  auto out = std::back_inserter(out_);
  if (config_.inline_schemas) {
    fmt::format_to(
      out, "{}{}: @{}[{}]\n", indent_str(indent), key, list.type_name, join_columns(list.schema));
  } else {
    fmt::format_to(out, "{}{}: @{}\n", indent_str(indent), key, list.type_name);
  }
  return write_rows(list.rows, indent + 1);
}

bool CanonicalWriter::write_rows(const std::vector<Node> & rows, size_t indent)
{
  if (!check_depth(indent)) {
    return false;
  }

  const std::string ind = indent_str(indent);
  const Node * prev = nullptr;
  for (const Node & node : rows) {
    out_ += ind;
    out_ += '|';
    if (node.child_count) {
      fmt::format_to(std::back_inserter(out_), "[{}] ", *node.child_count);
    }
    out_ += node.id;

    std::vector<bool> ditto;
    if (config_.use_ditto && prev != nullptr) {
      ditto = ditto_mask(node.fields, prev->fields);
    }
    for (size_t i = 0; i < node.fields.size(); ++i) {
      out_ += ',';
      if (i < ditto.size() && ditto[i]) {
        out_ += '^';
      } else {
        out_ += format_cell(node.fields[i]);
      }
    }
    out_ += '\n';

    for (const auto & [child_type, children] : node.children) {
      if (children.empty()) {
        continue;
      }
      const std::string * nested = doc_->get_child_type(node.type_name);
      if (nested == nullptr || *nested != child_type) {
        error_ = HedlError::schema(fmt::format(
          "row '{}' of type '{}' has '{}' children but no %NEST {} > {} is declared", node.id,
          node.type_name, child_type, node.type_name, child_type));
        return false;
      }
      if (!write_rows(children, indent + 1)) {
        return false;
      }
    }
    prev = &node;
  }
  return true;
}

// ============================================================================
// Entry points
// ============================================================================

Result<std::string> canonicalize(const Document & doc) { return CanonicalWriter{}.write(doc); }

Result<std::string> canonicalize_with_config(const Document & doc, const CanonicalConfig & config)
{
  return CanonicalWriter{config}.write(doc);
}

Status canonicalize_to(std::ostream & os, const Document & doc, const CanonicalConfig & config)
{
  auto text = canonicalize_with_config(doc, config);
  if (!text) {
    return Status::fail(text.error());
  }
  os << text.value();
  os.flush();
  if (!os) {
    return Status::fail(HedlError::io("failed to write canonical output to stream"));
  }
  return Status::ok();
}

}  // namespace hedl
