// hedl/syntax/value_parser.cpp - Value inference implementation
#include "hedl/syntax/value_parser.hpp"

#include <fmt/core.h>

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <system_error>
#include <utility>
#include <vector>

#include "hedl/syntax/lexer.hpp"

namespace hedl::syntax
{

namespace
{

constexpr size_t k_max_tensor_depth = 128;

bool is_number_char(char c) noexcept
{
  return (c >= '0' && c <= '9') || c == '.' || c == '-' || c == '+' || c == 'e' || c == 'E';
}

std::optional<Tensor> parse_tensor_element(
  Scanner & sc, size_t depth, std::string & error)
{
  if (depth > k_max_tensor_depth) {
    error = fmt::format("tensor nesting exceeds {} levels", k_max_tensor_depth);
    return std::nullopt;
  }

  sc.skip_spaces();
  if (!sc.match('[')) {
    const std::string_view num = sc.take_while(is_number_char);
    auto value = try_parse_number(num);
    if (!value) {
      error = num.empty() ? "expected number in tensor"
                          : fmt::format("invalid number '{}' in tensor", num);
      return std::nullopt;
    }
    const double d = value->is_int() ? static_cast<double>(value->as_int()) : value->as_float();
    return Tensor::scalar(d);
  }

  std::vector<Tensor> elements;
  sc.skip_spaces();
  if (sc.match(']')) {
    return Tensor::array(std::move(elements));
  }

  while (true) {
    auto elem = parse_tensor_element(sc, depth + 1, error);
    if (!elem) {
      return std::nullopt;
    }
    elements.push_back(std::move(*elem));
    sc.skip_spaces();
    if (sc.match(',')) {
      continue;
    }
    if (sc.match(']')) {
      break;
    }
    error = sc.eof() ? "unclosed '[' in tensor" : "expected ',' or ']' in tensor";
    return std::nullopt;
  }

  // All elements must share one shape
  const bool first_scalar = elements.front().is_scalar();
  const auto first_shape = elements.front().shape();
  for (const auto & e : elements) {
    if (e.is_scalar() != first_scalar || e.shape() != first_shape) {
      error = "ragged tensor: elements have different shapes";
      return std::nullopt;
    }
  }
  return Tensor::array(std::move(elements));
}

// `$(` ... `)` with balanced parentheses ending at the last character
std::optional<std::string> parse_expression_body(std::string_view token)
{
  int depth = 0;
  bool in_quote = false;
  for (size_t i = 1; i < token.size(); ++i) {
    const char c = token[i];
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
    } else if (c == '(') {
      ++depth;
    } else if (c == ')') {
      --depth;
      if (depth == 0) {
        if (i + 1 != token.size()) {
          return std::nullopt;
        }
        return std::string(token.substr(2, i - 2));
      }
    }
  }
  return std::nullopt;
}

}  // namespace

std::optional<Value> try_parse_number(std::string_view text)
{
  if (text.empty()) {
    return std::nullopt;
  }
  const char first = text[0];
  if (first != '-' && !(first >= '0' && first <= '9')) {
    return std::nullopt;
  }

  bool is_float = false;
  for (const char c : text) {
    if (!is_number_char(c)) {
      return std::nullopt;
    }
    if (c == '.' || c == 'e' || c == 'E') {
      is_float = true;
    }
  }

  if (!is_float) {
    int64_t v = 0;
    const char * end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, v);
    if (ec != std::errc{} || ptr != end) {
      return std::nullopt;
    }
    return Value::make_int(v);
  }

  if (text.back() == '.') {
    return std::nullopt;
  }
  const std::string buf(text);
  char * end = nullptr;
  const double d = std::strtod(buf.c_str(), &end);
  if (end != buf.c_str() + buf.size() || !std::isfinite(d)) {
    return std::nullopt;
  }
  return Value::make_float(d);
}

Result<Reference> parse_reference(std::string_view text, size_t line)
{
  using R = Result<Reference>;

  if (text.empty() || text[0] != '@') {
    return R::fail(HedlError::syntax("reference must start with '@'", line));
  }
  const std::string_view body = text.substr(1);
  const size_t colon = body.find(':');
  if (colon == std::string_view::npos) {
    if (!is_id_token(body)) {
      return R::fail(HedlError::syntax(fmt::format("invalid reference '{}'", text), line));
    }
    return R::ok(Reference::local(std::string(body)));
  }

  const std::string_view type = body.substr(0, colon);
  const std::string_view id = body.substr(colon + 1);
  if (!is_type_name(type)) {
    return R::fail(
      HedlError::syntax(fmt::format("invalid type name '{}' in reference '{}'", type, text), line));
  }
  if (!is_id_token(id)) {
    return R::fail(
      HedlError::syntax(fmt::format("invalid id '{}' in reference '{}'", id, text), line));
  }
  return R::ok(Reference::qualified(std::string(type), std::string(id)));
}

Result<Tensor> parse_tensor(std::string_view text, size_t line)
{
  Scanner sc(trim(text));
  std::string error;
  auto tensor = parse_tensor_element(sc, 0, error);
  if (!tensor) {
    return Result<Tensor>::fail(HedlError::syntax(error, line));
  }
  sc.skip_spaces();
  if (!sc.eof()) {
    return Result<Tensor>::fail(HedlError::syntax(
      fmt::format("unexpected characters after tensor: '{}'", sc.rest()), line));
  }
  if (tensor->is_scalar()) {
    return Result<Tensor>::fail(HedlError::syntax("tensor literal must be bracketed", line));
  }
  return Result<Tensor>::ok(std::move(*tensor));
}

Result<Value> infer_value(std::string_view token, const AliasTable & aliases, size_t line)
{
  using R = Result<Value>;

  if (token == "~") {
    return R::ok(Value::make_null());
  }
  if (token == "true") {
    return R::ok(Value::make_bool(true));
  }
  if (token == "false") {
    return R::ok(Value::make_bool(false));
  }

  if (!token.empty() && token[0] == '@') {
    auto ref = parse_reference(token, line);
    if (!ref) {
      return R::fail(ref.error());
    }
    return R::ok(Value::make_reference(std::move(ref).value()));
  }

  if (token.size() >= 2 && token[0] == '$' && token[1] == '(') {
    auto body = parse_expression_body(token);
    if (!body) {
      return R::fail(HedlError::syntax(fmt::format("malformed expression '{}'", token), line));
    }
    return R::ok(Value::make_expression(std::move(*body)));
  }

  if (!token.empty() && token[0] == '$' && is_key_token(token.substr(1))) {
    auto it = aliases.find(token.substr(1));
    if (it == aliases.end()) {
      return R::fail(HedlError::alias(fmt::format("undefined alias '{}'", token), line));
    }
    return R::ok(infer_alias_expansion(it->second));
  }

  if (!token.empty() && token[0] == '[') {
    auto tensor = parse_tensor(token, line);
    if (!tensor) {
      return R::fail(tensor.error());
    }
    return R::ok(Value::make_tensor(std::move(tensor).value()));
  }

  if (auto number = try_parse_number(token)) {
    return R::ok(std::move(*number));
  }

  return R::ok(Value::make_string(std::string(token)));
}

Value infer_alias_expansion(std::string_view text)
{
  if (text == "true") {
    return Value::make_bool(true);
  }
  if (text == "false") {
    return Value::make_bool(false);
  }
  if (auto number = try_parse_number(text)) {
    return std::move(*number);
  }
  return Value::make_string(std::string(text));
}

}  // namespace hedl::syntax
