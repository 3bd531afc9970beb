// hedl/driver/engine.cpp - Parse pipeline driver
//
#include "hedl/driver/engine.hpp"

#include <fmt/core.h>

#include <fstream>
#include <iterator>
#include <string>
#include <utility>

#include "hedl/sema/reference_resolver.hpp"
#include "hedl/syntax/parser.hpp"

namespace hedl
{

Result<Document> parse_with_options(std::string_view bytes, const ParseOptions & options)
{
  using R = Result<Document>;

  auto doc = parse(bytes, options.limits);
  if (!doc) {
    return doc;
  }

  if (options.resolve_refs) {
    auto status = resolve_references(doc.value(), options.strict_refs, options.limits);
    if (!status) {
      return R::fail(status.error());
    }
  }

  return doc;
}

Result<Document> parse_file(const std::filesystem::path & path, const ParseOptions & options)
{
  using R = Result<Document>;
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return R::fail(HedlError::io(fmt::format("file not found: {}", path.string())));
  }

  // Reject oversized files before reading them into memory
  const auto size = fs::file_size(path, ec);
  if (!ec && size > options.limits.max_file_size) {
    return R::fail(HedlError::security(fmt::format(
      "file size {} exceeds limit {}", size, options.limits.max_file_size)));
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return R::fail(HedlError::io(fmt::format("cannot open file: {}", path.string())));
  }

  std::string bytes{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  if (in.bad()) {
    return R::fail(HedlError::io(fmt::format("failed to read file: {}", path.string())));
  }

  return parse_with_options(bytes, options);
}

}  // namespace hedl
