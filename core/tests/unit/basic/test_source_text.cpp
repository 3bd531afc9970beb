#include <gtest/gtest.h>

#include "hedl/basic/source_text.hpp"

using hedl::SourceText;

TEST(BasicSourceText, TrailingNewlineDoesNotAddLine)
{
  const SourceText src("a\nb\n");
  EXPECT_EQ(src.line_count(), 2U);
  EXPECT_EQ(src.get_line(0), "a");
  EXPECT_EQ(src.get_line(1), "b");
}

TEST(BasicSourceText, LastLineWithoutNewline)
{
  const SourceText src("first\nsecond");
  EXPECT_EQ(src.line_count(), 2U);
  EXPECT_EQ(src.get_line(1), "second");
}

TEST(BasicSourceText, EmptyContent)
{
  const SourceText src("");
  EXPECT_EQ(src.line_count(), 0U);
  EXPECT_EQ(src.get_line(0), "");
}

TEST(BasicSourceText, BlankLinesAreKept)
{
  const SourceText src("a\n\nc\n");
  EXPECT_EQ(src.line_count(), 3U);
  EXPECT_EQ(src.get_line(1), "");
  EXPECT_EQ(src.get_line(2), "c");
  EXPECT_EQ(src.get_line(3), "");
}

TEST(BasicSourceText, LineOfOffset)
{
  const SourceText src("ab\ncd\nef");
  EXPECT_EQ(src.line_of_offset(0), 1U);
  EXPECT_EQ(src.line_of_offset(2), 1U);
  EXPECT_EQ(src.line_of_offset(3), 2U);
  EXPECT_EQ(src.line_of_offset(7), 3U);
}
