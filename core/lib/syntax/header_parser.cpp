// hedl/syntax/header_parser.cpp - Header directive parsing
#include "hedl/syntax/header_parser.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "hedl/syntax/lexer.hpp"
#include "hedl/syntax/schema.hpp"

namespace hedl::syntax
{

namespace
{

bool is_upper_char(char c) noexcept { return c >= 'A' && c <= 'Z'; }
bool is_digit_char(char c) noexcept { return c >= '0' && c <= '9'; }
bool is_word_char(char c) noexcept
{
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || is_digit_char(c) || c == '_';
}

std::optional<uint32_t> parse_version_part(std::string_view s)
{
  if (s.empty() || !std::all_of(s.begin(), s.end(), is_digit_char)) {
    return std::nullopt;
  }
  uint32_t v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size()) {
    return std::nullopt;
  }
  return v;
}

bool is_separator(std::string_view line) noexcept
{
  if (line.substr(0, 3) != "---") {
    return false;
  }
  const std::string_view after = trim(line.substr(3));
  return after.empty() || after[0] == '#';
}

}  // namespace

Result<size_t> HeaderParser::parse()
{
  using R = Result<size_t>;

  for (size_t i = 0; i < src_.line_count(); ++i) {
    const size_t line_no = i + 1;
    const std::string_view raw = src_.get_line(i);
    const std::string_view t = trim(raw);

    if (t.empty() || t[0] == '#') {
      continue;
    }

    if (is_separator(t)) {
      if (raw[0] != '-') {
        return R::fail(HedlError::syntax("'---' separator must not be indented", line_no));
      }
      if (!saw_version_) {
        return R::fail(
          HedlError::version("missing %VERSION directive", line_no)
            .with_help("add '%VERSION: 1.0' as the first line"));
      }
      return R::ok(i + 1);
    }

    if (raw[0] == ' ' || raw[0] == '\t') {
      return R::fail(HedlError::syntax("header directives must not be indented", line_no));
    }
    if (t[0] != '%') {
      return R::fail(HedlError::syntax(
        fmt::format("expected a directive or '---' separator, found '{}'", t), line_no));
    }

    if (!parse_directive(strip_comment(t), line_no)) {
      return R::fail(std::move(*error_));
    }
  }

  return R::fail(HedlError::syntax(
    "missing '---' separator between header and body", src_.line_count()));
}

bool HeaderParser::parse_directive(std::string_view content, size_t line)
{
  Scanner sc(content);
  sc.advance();  // '%'
  const std::string_view name = sc.take_while(is_upper_char);
  const bool has_colon = sc.match(':');
  const std::string_view payload = trim(sc.rest());

  if (name == "VERSION") {
    if (saw_version_) {
      return fail(HedlError::version("duplicate %VERSION directive", line));
    }
    if (!has_colon) {
      return fail(HedlError::version("expected ':' after %VERSION", line));
    }
    return parse_version(payload, line);
  }

  if (name != "STRUCT" && name != "ALIAS" && name != "NEST") {
    return fail(HedlError::syntax(fmt::format("unknown directive '%{}'", name), line));
  }

  if (!saw_version_) {
    return fail(HedlError::version("%VERSION must be the first directive", line));
  }

  if (name == "STRUCT") {
    if (!has_colon) {
      return fail(HedlError::syntax("expected ':' after %STRUCT", line));
    }
    return parse_struct(payload, line);
  }
  if (name == "ALIAS") {
    return parse_alias(payload, line);
  }
  return parse_nest(payload, line);
}

bool HeaderParser::parse_version(std::string_view payload, size_t line)
{
  const size_t dot = payload.find('.');
  if (dot == std::string_view::npos) {
    return fail(HedlError::version(
      fmt::format("invalid version format '{}', expected major.minor", payload), line));
  }
  const std::string_view major_s = payload.substr(0, dot);
  const std::string_view minor_s = payload.substr(dot + 1);
  const auto major = parse_version_part(major_s);
  const auto minor = parse_version_part(minor_s);
  if (!major || !minor) {
    return fail(HedlError::version(
      fmt::format("invalid version format '{}', expected major.minor", payload), line));
  }
  if ((major_s.size() > 1 && major_s[0] == '0') || (minor_s.size() > 1 && minor_s[0] == '0')) {
    return fail(HedlError::version("version numbers must not have leading zeros", line));
  }

  doc_.version = {*major, *minor};
  saw_version_ = true;
  return true;
}

bool HeaderParser::parse_struct(std::string_view payload, size_t line)
{
  Scanner sc(payload);
  const std::string_view type = sc.take_while(is_word_char);
  if (!is_type_name(type)) {
    return fail(HedlError::syntax(
      fmt::format("invalid type name '{}': must start with an uppercase letter", type), line));
  }

  sc.skip_spaces();
  if (sc.match('(')) {
    sc.skip_spaces();
    const std::string_view count = sc.take_while(is_digit_char);
    sc.skip_spaces();
    if (count.empty() || !sc.match(')')) {
      return fail(HedlError::syntax("invalid row count in %STRUCT, expected '(N)'", line));
    }
    sc.skip_spaces();
  }

  if (!sc.match(':')) {
    return fail(HedlError::syntax(
      fmt::format("expected ':' after type name in %STRUCT {}", type), line));
  }

  auto columns = parse_schema_columns(trim(sc.rest()), limits_, line);
  if (!columns) {
    return fail(columns.error());
  }

  auto it = doc_.structs.find(type);
  if (it != doc_.structs.end()) {
    if (it->second != columns.value()) {
      return fail(HedlError::schema(
        fmt::format("conflicting redefinition of struct '{}'", type), line));
    }
    return true;
  }

  doc_.structs.emplace(std::string(type), std::move(columns).value());
  return true;
}

bool HeaderParser::parse_alias(std::string_view payload, size_t line)
{
  Scanner sc(payload);
  const std::string_view name = sc.take_while(is_word_char);
  if (!is_key_token(name)) {
    return fail(HedlError::syntax(fmt::format("invalid alias name '{}'", name), line));
  }
  sc.skip_spaces();
  if (!sc.match('=')) {
    return fail(HedlError::syntax(
      fmt::format("expected '=' after alias name '{}'", name), line));
  }

  auto value = parse_quoted(sc.rest(), line);
  if (!value) {
    return fail(value.error());
  }

  if (doc_.aliases.find(name) != doc_.aliases.end()) {
    return fail(HedlError::alias(fmt::format("duplicate alias '{}'", name), line));
  }
  if (doc_.aliases.size() >= limits_.max_aliases) {
    return fail(HedlError::security(
      fmt::format("too many aliases: exceeds limit of {}", limits_.max_aliases), line));
  }
  if (value.value().size() > limits_.max_block_string_size) {
    return fail(HedlError::security(
      fmt::format(
        "alias value size {} exceeds limit {}", value.value().size(),
        limits_.max_block_string_size),
      line));
  }

  doc_.aliases.emplace(std::string(name), std::move(value).value());
  return true;
}

bool HeaderParser::parse_nest(std::string_view payload, size_t line)
{
  const size_t gt = payload.find('>');
  if (gt == std::string_view::npos) {
    return fail(HedlError::syntax("expected 'Parent > Child' in %NEST", line));
  }
  const std::string_view parent = trim(payload.substr(0, gt));
  const std::string_view child = trim(payload.substr(gt + 1));

  for (const auto type : {parent, child}) {
    if (!is_type_name(type)) {
      return fail(HedlError::syntax(fmt::format("invalid type name '{}' in %NEST", type), line));
    }
    if (doc_.structs.find(type) == doc_.structs.end()) {
      return fail(HedlError::schema(
        fmt::format("%NEST references undefined struct '{}'", type), line));
    }
  }

  if (doc_.nests.find(parent) != doc_.nests.end()) {
    return fail(HedlError::schema(
      fmt::format("duplicate %NEST rule for parent '{}'", parent), line));
  }

  doc_.nests.emplace(std::string(parent), std::string(child));
  return true;
}

}  // namespace hedl::syntax
