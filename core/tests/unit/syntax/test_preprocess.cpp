#include <gtest/gtest.h>

#include <string>

#include "hedl/basic/limits.hpp"
#include "hedl/syntax/preprocess.hpp"

using hedl::ErrorKind;
using hedl::Limits;
using hedl::syntax::preprocess;
using hedl::syntax::valid_utf8_prefix;

TEST(SyntaxPreprocess, StripsBomAndNormalizesCrlf)
{
  auto src = preprocess("\xEF\xBB\xBF%VERSION: 1.0\r\n---\r\n", Limits{});
  ASSERT_TRUE(src) << src.error().to_string();
  EXPECT_EQ(src.value().content(), "%VERSION: 1.0\n---\n");
  EXPECT_EQ(src.value().line_count(), 2U);
}

TEST(SyntaxPreprocess, RejectsBareCr)
{
  auto src = preprocess("a\rb\n", Limits{});
  ASSERT_FALSE(src);
  EXPECT_EQ(src.error().kind, ErrorKind::Syntax);
}

TEST(SyntaxPreprocess, RejectsControlCharacters)
{
  auto src = preprocess("ok\nbad\x01here\n", Limits{});
  ASSERT_FALSE(src);
  EXPECT_EQ(src.error().kind, ErrorKind::Syntax);
  EXPECT_EQ(src.error().line, 2U);
  EXPECT_NE(src.error().message.find("U+0001"), std::string::npos);
}

TEST(SyntaxPreprocess, AllowsTabs)
{
  EXPECT_TRUE(preprocess("a\tb\n", Limits{}));
}

TEST(SyntaxPreprocess, RejectsInvalidUtf8)
{
  auto src = preprocess("abc\xC3(\n", Limits{});
  ASSERT_FALSE(src);
  EXPECT_EQ(src.error().kind, ErrorKind::Syntax);
  EXPECT_EQ(valid_utf8_prefix("abc\xC3("), 3U);
  EXPECT_EQ(valid_utf8_prefix("caf\xC3\xA9"), 5U);
}

TEST(SyntaxPreprocess, FileSizeLimit)
{
  Limits limits;
  limits.max_file_size = 4;
  auto src = preprocess("12345", limits);
  ASSERT_FALSE(src);
  EXPECT_EQ(src.error().kind, ErrorKind::Security);
}

TEST(SyntaxPreprocess, LineLengthLimit)
{
  Limits limits;
  limits.max_line_length = 3;
  EXPECT_TRUE(preprocess("abc\nde\n", limits));
  auto src = preprocess("abc\nabcd\n", limits);
  ASSERT_FALSE(src);
  EXPECT_EQ(src.error().kind, ErrorKind::Security);
  EXPECT_EQ(src.error().line, 2U);
}
