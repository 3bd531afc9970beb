// hedl/basic/error_printer.hpp
//
// Prints errors with the offending source line and a marker underneath.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "hedl/basic/error.hpp"
#include "hedl/basic/source_text.hpp"

namespace hedl
{

/**
 * Prints errors in a compiler-style layout.
 *
 * Produces output like:
 *   error[Shape]: row has 2 cells, expected 3
 *     --> users.hedl:5
 *      |
 *    5 |   |alice,Alice
 *      |   ^^^^^^^^^^^^
 *      |
 *      = help: the id column is implicit, do not list it in %STRUCT
 */
class ErrorPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit ErrorPrinter(std::ostream & os, bool use_color = true);

  /**
   * Print one error.
   *
   * @param error Error to print
   * @param source Normalized input for the source snippet, or nullptr
   * @param name Display name for the location line
   */
  void print(
    const HedlError & error, const SourceText * source = nullptr,
    std::string_view name = "<input>");

private:
  void print_header(const HedlError & error);
  void print_source_line(const SourceText & source, size_t line_num);
  void print_help(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace hedl
