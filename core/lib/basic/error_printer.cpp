// hedl/basic/error_printer.cpp - Error output with source context
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "hedl/basic/error_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <ostream>
#include <rang.hpp>

namespace hedl
{

ErrorPrinter::ErrorPrinter(std::ostream & os, bool use_color) : os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void ErrorPrinter::print(const HedlError & error, const SourceText * source, std::string_view name)
{
  print_header(error);

  if (error.line > 0) {
    fmt::print(os_, "{} {}:{}\n", gutter_arrow(), name, error.line);
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), name);
  }

  if (source != nullptr && error.line > 0 && error.line <= source->line_count()) {
    fmt::print(os_, "{}\n", gutter_pipe());
    print_source_line(*source, error.line);
  }

  if (error.help_message) {
    print_help(*error.help_message);
  }

  fmt::print(os_, "\n");
}

// =============================================================================
// Private helpers
// =============================================================================

void ErrorPrinter::print_header(const HedlError & error)
{
  if (use_color_) {
    os_ << rang::style::bold << rang::fg::red << "error[" << to_string(error.kind) << "]"
        << rang::fg::reset << ": " << error.message << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "error[{}]: {}\n", to_string(error.kind), error.message);
  }
}

void ErrorPrinter::print_source_line(const SourceText & source, size_t line_num)
{
  const std::string_view line = source.get_line(line_num - 1);

  // Tabs are widened so the marker stays aligned
  std::string cleaned;
  std::string marker_prefix;
  size_t marker_len = 0;
  bool in_content = false;
  for (const char c : line) {
    const bool blank = (c == ' ' || c == '\t');
    const std::string piece = (c == '\t') ? std::string(4, ' ') : std::string(1, c);
    cleaned += piece;
    if (!in_content && blank) {
      marker_prefix += piece;
      continue;
    }
    in_content = true;
    marker_len += piece.size();
  }
  if (marker_len == 0) {
    marker_len = 1;
  }

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_num);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_num);
  }
  fmt::print(os_, "{}\n", cleaned);

  fmt::print(os_, "{} {}", gutter_pipe(), marker_prefix);
  if (use_color_) {
    os_ << rang::fg::red << rang::style::bold;
    fmt::print(os_, "{}", std::string(marker_len, '^'));
    os_ << rang::style::reset << rang::fg::reset;
  } else {
    fmt::print(os_, "{}", std::string(marker_len, '^'));
  }
  fmt::print(os_, "\n");
}

void ErrorPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "   = help: {}\n", message);
  }
}

std::string ErrorPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}  -->{}", "\033[1;36m", "\033[0m");
  }
  return "  -->";
}

std::string ErrorPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

}  // namespace hedl
