// hedl/basic/error.cpp - Error construction and rendering
#include "hedl/basic/error.hpp"

#include <fmt/core.h>

#include <utility>

namespace hedl
{

namespace
{

HedlError make_error(ErrorKind kind, std::string msg, size_t line)
{
  HedlError e;
  e.kind = kind;
  e.message = std::move(msg);
  e.line = line;
  return e;
}

}  // namespace

HedlError HedlError::syntax(std::string msg, size_t line)
{
  return make_error(ErrorKind::Syntax, std::move(msg), line);
}

HedlError HedlError::version(std::string msg, size_t line)
{
  return make_error(ErrorKind::Version, std::move(msg), line);
}

HedlError HedlError::schema(std::string msg, size_t line)
{
  return make_error(ErrorKind::Schema, std::move(msg), line);
}

HedlError HedlError::alias(std::string msg, size_t line)
{
  return make_error(ErrorKind::Alias, std::move(msg), line);
}

HedlError HedlError::shape(std::string msg, size_t line)
{
  return make_error(ErrorKind::Shape, std::move(msg), line);
}

HedlError HedlError::semantic(std::string msg, size_t line)
{
  return make_error(ErrorKind::Semantic, std::move(msg), line);
}

HedlError HedlError::orphan_row(std::string msg, size_t line)
{
  return make_error(ErrorKind::OrphanRow, std::move(msg), line);
}

HedlError HedlError::collision(std::string msg, size_t line)
{
  return make_error(ErrorKind::Collision, std::move(msg), line);
}

HedlError HedlError::reference(std::string msg, size_t line)
{
  return make_error(ErrorKind::Reference, std::move(msg), line);
}

HedlError HedlError::security(std::string msg, size_t line)
{
  return make_error(ErrorKind::Security, std::move(msg), line);
}

HedlError HedlError::io(std::string msg) { return make_error(ErrorKind::IO, std::move(msg), 0); }

std::string HedlError::to_string() const
{
  if (line == 0) {
    return fmt::format("{}Error: {}", hedl::to_string(kind), message);
  }
  return fmt::format("{}Error at line {}: {}", hedl::to_string(kind), line, message);
}

}  // namespace hedl
