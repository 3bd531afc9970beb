// hedl/syntax/parser.cpp - Parse pipeline
#include "hedl/syntax/parser.hpp"

#include <utility>

#include "hedl/syntax/body_parser.hpp"
#include "hedl/syntax/header_parser.hpp"
#include "hedl/syntax/preprocess.hpp"

namespace hedl
{

Result<Document> parse(std::string_view bytes, const Limits & limits)
{
  using R = Result<Document>;

  auto src = syntax::preprocess(bytes, limits);
  if (!src) {
    return R::fail(src.error());
  }

  Document doc;

  syntax::HeaderParser header(src.value(), limits, doc);
  auto body_start = header.parse();
  if (!body_start) {
    return R::fail(body_start.error());
  }

  syntax::BodyParser body(src.value(), limits, doc);
  auto status = body.parse(body_start.value());
  if (!status) {
    return R::fail(status.error());
  }

  return R::ok(std::move(doc));
}

}  // namespace hedl
