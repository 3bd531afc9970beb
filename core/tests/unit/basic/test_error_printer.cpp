#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "hedl/basic/error_printer.hpp"

using hedl::ErrorPrinter;
using hedl::HedlError;
using hedl::SourceText;

TEST(BasicErrorPrinter, PrintsHeaderLocationAndSnippet)
{
  const SourceText src("%VERSION: 1.0\n---\n  bad line\n");
  std::ostringstream out;
  ErrorPrinter printer(out, false);
  printer.print(HedlError::syntax("something is wrong", 3), &src, "doc.hedl");

  const std::string text = out.str();
  EXPECT_NE(text.find("error[Syntax]: something is wrong"), std::string::npos);
  EXPECT_NE(text.find("--> doc.hedl:3"), std::string::npos);
  EXPECT_NE(text.find("   3 |   bad line"), std::string::npos);
  EXPECT_NE(text.find("^^^^^^^^"), std::string::npos);
}

TEST(BasicErrorPrinter, PrintsHelp)
{
  std::ostringstream out;
  ErrorPrinter printer(out, false);
  HedlError err = HedlError::version("missing %VERSION directive", 1);
  err.with_help("add '%VERSION: 1.0' as the first line");
  printer.print(err);

  const std::string text = out.str();
  EXPECT_NE(text.find("error[Version]"), std::string::npos);
  EXPECT_NE(text.find("= help: add '%VERSION: 1.0' as the first line"), std::string::npos);
}

TEST(BasicErrorPrinter, NoSnippetWithoutLine)
{
  const SourceText src("x\n");
  std::ostringstream out;
  ErrorPrinter printer(out, false);
  printer.print(HedlError::io("stream closed"), &src);

  const std::string text = out.str();
  EXPECT_NE(text.find("error[IO]: stream closed"), std::string::npos);
  EXPECT_NE(text.find("--> <input>"), std::string::npos);
  EXPECT_EQ(text.find(" | "), std::string::npos);
}
