#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "hedl/sema/type_registry.hpp"

using hedl::ErrorKind;
using hedl::TypeRegistry;

TEST(SemaTypeRegistry, RegisterAndLookup)
{
  TypeRegistry reg;
  EXPECT_TRUE(reg.empty());
  ASSERT_TRUE(reg.register_id("User", "alice", 5));
  ASSERT_TRUE(reg.register_id("User", "bob", 6));
  ASSERT_TRUE(reg.register_id("Team", "alice", 12));

  EXPECT_EQ(reg.size(), 3U);
  EXPECT_TRUE(reg.contains("User", "alice"));
  EXPECT_FALSE(reg.contains("Team", "bob"));
  EXPECT_EQ(reg.line_of("Team", "alice"), 12U);
  EXPECT_FALSE(reg.line_of("Team", "carol").has_value());
}

TEST(SemaTypeRegistry, InvertedIndexKeepsRegistrationOrder)
{
  TypeRegistry reg;
  ASSERT_TRUE(reg.register_id("User", "alice", 1));
  ASSERT_TRUE(reg.register_id("Team", "alice", 2));

  EXPECT_EQ(reg.types_with_id("alice"), (std::vector<std::string>{"User", "Team"}));
  EXPECT_TRUE(reg.types_with_id("nobody").empty());

  const auto * users = reg.ids_of_type("User");
  ASSERT_NE(users, nullptr);
  EXPECT_EQ(users->size(), 1U);
  EXPECT_EQ(reg.ids_of_type("Post"), nullptr);
}

TEST(SemaTypeRegistry, DuplicateIsCollision)
{
  TypeRegistry reg;
  ASSERT_TRUE(reg.register_id("User", "alice", 5));

  const auto status = reg.register_id("User", "alice", 9);
  ASSERT_FALSE(status);
  EXPECT_EQ(status.error().kind, ErrorKind::Collision);
  EXPECT_EQ(status.error().line, 9U);
  EXPECT_NE(status.error().message.find("alice"), std::string::npos);
  EXPECT_NE(status.error().message.find("5"), std::string::npos);
  EXPECT_EQ(reg.size(), 1U);
}
