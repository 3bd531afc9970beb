#include <gtest/gtest.h>

#include <string>
#include <string_view>

#include "hedl/syntax/lexer.hpp"

using hedl::syntax::is_id_token;
using hedl::syntax::is_key_token;
using hedl::syntax::is_type_name;
using hedl::syntax::parse_quoted;
using hedl::syntax::split_row_cells;
using hedl::syntax::strip_comment;

TEST(SyntaxLexer, TokenPredicates)
{
  EXPECT_TRUE(is_key_token("key_1"));
  EXPECT_TRUE(is_key_token("_private"));
  EXPECT_FALSE(is_key_token("Key"));
  EXPECT_FALSE(is_key_token("1key"));
  EXPECT_FALSE(is_key_token("my-key"));
  EXPECT_FALSE(is_key_token(""));

  EXPECT_TRUE(is_id_token("alice"));
  EXPECT_TRUE(is_id_token("SKU-4021"));
  EXPECT_FALSE(is_id_token("-x"));
  EXPECT_FALSE(is_id_token("9lives"));

  EXPECT_TRUE(is_type_name("User"));
  EXPECT_TRUE(is_type_name("HttpRequest2"));
  EXPECT_FALSE(is_type_name("user"));
}

TEST(SyntaxLexer, StripCommentRespectsQuotesAndExpressions)
{
  EXPECT_EQ(strip_comment("value # note"), "value");
  EXPECT_EQ(strip_comment("\"a # b\" # note"), "\"a # b\"");
  EXPECT_EQ(strip_comment("$(x # y) # note"), "$(x # y)");
  EXPECT_EQ(strip_comment("no comment   "), "no comment");
}

TEST(SyntaxLexer, QuotedStringEscapes)
{
  auto doubled = parse_quoted(R"("say ""hi""")", 1);
  ASSERT_TRUE(doubled);
  EXPECT_EQ(doubled.value(), "say \"hi\"");

  auto escaped = parse_quoted(R"("a\nb\tc\\d\"e")", 1);
  ASSERT_TRUE(escaped);
  EXPECT_EQ(escaped.value(), "a\nb\tc\\d\"e");

  auto unicode = parse_quoted(R"("caf\u00e9")", 1);
  ASSERT_TRUE(unicode);
  EXPECT_EQ(unicode.value(), "caf\xC3\xA9");
}

TEST(SyntaxLexer, QuotedStringErrors)
{
  EXPECT_FALSE(parse_quoted("\"unterminated", 4));
  EXPECT_FALSE(parse_quoted("\"ok\" trailing", 4));
  EXPECT_FALSE(parse_quoted("bare", 4));
}

TEST(SyntaxLexer, SplitRowCellsPlain)
{
  auto cells = split_row_cells("alice, Alice Smith ,30", 1);
  ASSERT_TRUE(cells);
  ASSERT_EQ(cells.value().size(), 3U);
  EXPECT_EQ(cells.value()[0].text, "alice");
  EXPECT_EQ(cells.value()[1].text, "Alice Smith");
  EXPECT_EQ(cells.value()[2].text, "30");
  EXPECT_FALSE(cells.value()[1].quoted);
}

TEST(SyntaxLexer, SplitRowCellsKeepsNestedCommas)
{
  auto cells = split_row_cells(R"(p1,"Smith, J",$(f(a, b)),[1, 2])", 1);
  ASSERT_TRUE(cells);
  ASSERT_EQ(cells.value().size(), 4U);
  EXPECT_EQ(cells.value()[1].text, "Smith, J");
  EXPECT_TRUE(cells.value()[1].quoted);
  EXPECT_EQ(cells.value()[2].text, "$(f(a, b))");
  EXPECT_EQ(cells.value()[3].text, "[1, 2]");
}

TEST(SyntaxLexer, SplitRowCellsErrors)
{
  EXPECT_FALSE(split_row_cells("a,b,", 2));
  EXPECT_FALSE(split_row_cells("a,b\"c", 2));
  EXPECT_FALSE(split_row_cells("a,$(x", 2));
  EXPECT_FALSE(split_row_cells("a,[1, 2", 2));
  EXPECT_FALSE(split_row_cells("a,\"open", 2));
}

TEST(SyntaxLexer, EmptyRowHasNoCells)
{
  auto cells = split_row_cells("   ", 1);
  ASSERT_TRUE(cells);
  EXPECT_TRUE(cells.value().empty());
}
