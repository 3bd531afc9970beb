#include <gtest/gtest.h>

#include <limits>

#include "hedl/basic/limits.hpp"

using hedl::Limits;

TEST(BasicLimits, DefaultValues)
{
  const Limits l = Limits::defaults();
  EXPECT_EQ(l.max_file_size, size_t{1024} * 1024 * 1024);
  EXPECT_EQ(l.max_line_length, size_t{1024} * 1024);
  EXPECT_EQ(l.max_indent_depth, 50U);
  EXPECT_EQ(l.max_nodes, 10'000'000U);
  EXPECT_EQ(l.max_aliases, 10'000U);
  EXPECT_EQ(l.max_columns, 100U);
  EXPECT_EQ(l.max_nest_depth, 100U);
  EXPECT_EQ(l.max_block_string_size, size_t{10} * 1024 * 1024);
  EXPECT_EQ(l.max_object_keys, 10'000U);
  EXPECT_EQ(l.max_total_keys, 10'000'000U);
}

TEST(BasicLimits, DefaultConstructedEqualsDefaults)
{
  const Limits a;
  const Limits b = Limits::defaults();
  EXPECT_EQ(a.max_nodes, b.max_nodes);
  EXPECT_EQ(a.max_total_keys, b.max_total_keys);
  EXPECT_EQ(a.max_nest_depth, b.max_nest_depth);
}

TEST(BasicLimits, UnlimitedSetsEveryFieldToMax)
{
  constexpr size_t k_max = std::numeric_limits<size_t>::max();
  constexpr Limits l = Limits::unlimited();
  EXPECT_EQ(l.max_file_size, k_max);
  EXPECT_EQ(l.max_line_length, k_max);
  EXPECT_EQ(l.max_indent_depth, k_max);
  EXPECT_EQ(l.max_nodes, k_max);
  EXPECT_EQ(l.max_aliases, k_max);
  EXPECT_EQ(l.max_columns, k_max);
  EXPECT_EQ(l.max_nest_depth, k_max);
  EXPECT_EQ(l.max_block_string_size, k_max);
  EXPECT_EQ(l.max_object_keys, k_max);
  EXPECT_EQ(l.max_total_keys, k_max);
}
