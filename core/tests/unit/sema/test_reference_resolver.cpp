#include <gtest/gtest.h>

#include <string>

#include "hedl/sema/reference_resolver.hpp"
#include "hedl/syntax/parser.hpp"

using hedl::Document;
using hedl::ErrorKind;
using hedl::Limits;
using hedl::parse;
using hedl::resolve_references;

namespace
{

Document parse_ok(std::string_view src)
{
  auto doc = parse(src);
  EXPECT_TRUE(doc) << doc.error().to_string();
  return doc ? doc.value() : Document{};
}

const char * const k_people =
  "%VERSION: 1.0\n"
  "%STRUCT: User: [name, manager]\n"
  "%STRUCT: Team: [lead]\n"
  "---\n"
  "users: @User\n"
  "  |alice,Alice,~\n"
  "  |bob,Bob,@alice\n"
  "teams: @Team\n"
  "  |core,@User:alice\n";

}  // namespace

TEST(SemaReferenceResolver, ResolvesLocalAndQualified)
{
  const Document doc = parse_ok(k_people);
  EXPECT_TRUE(resolve_references(doc, true));
}

TEST(SemaReferenceResolver, RowReferenceLooksInOwnType)
{
  // @core exists only as a Team; inside a User row it is unresolved
  const Document doc = parse_ok(
    "%VERSION: 1.0\n%STRUCT: User: [peer]\n%STRUCT: Team: [x]\n---\n"
    "teams: @Team\n  |core,1\n"
    "users: @User\n  |alice,@core\n");

  const auto strict = resolve_references(doc, true);
  ASSERT_FALSE(strict);
  EXPECT_EQ(strict.error().kind, ErrorKind::Reference);
  EXPECT_EQ(strict.error().line, 8U);

  EXPECT_TRUE(resolve_references(doc, false));
}

TEST(SemaReferenceResolver, UnresolvedIsErrorOnlyWhenStrict)
{
  const Document doc = parse_ok("%VERSION: 1.0\n---\nowner: @ghost\n");
  const auto strict = resolve_references(doc, true);
  ASSERT_FALSE(strict);
  EXPECT_NE(strict.error().message.find("@ghost"), std::string::npos);
  EXPECT_TRUE(resolve_references(doc, false));
}

TEST(SemaReferenceResolver, AmbiguityIsFatalInBothModes)
{
  const Document doc = parse_ok(
    "%VERSION: 1.0\n%STRUCT: User: [name]\n%STRUCT: Team: [name]\n---\n"
    "users: @User\n  |alice,Alice\n"
    "teams: @Team\n  |alice,Alpha\n"
    "owner: @alice\n");

  for (const bool strict : {true, false}) {
    const auto status = resolve_references(doc, strict);
    ASSERT_FALSE(status) << "strict=" << strict;
    EXPECT_EQ(status.error().kind, ErrorKind::Reference);
    EXPECT_NE(status.error().message.find("Ambiguous"), std::string::npos);
    EXPECT_TRUE(status.error().help_message.has_value());
  }

  const Document qualified = parse_ok(
    "%VERSION: 1.0\n%STRUCT: User: [name]\n%STRUCT: Team: [name]\n---\n"
    "users: @User\n  |alice,Alice\n"
    "teams: @Team\n  |alice,Alpha\n"
    "owner: @Team:alice\n");
  EXPECT_TRUE(resolve_references(qualified, true));
}

TEST(SemaReferenceResolver, CollisionIsFatalInBothModes)
{
  const Document doc = parse_ok(
    "%VERSION: 1.0\n%STRUCT: User: [name]\n---\n"
    "a: @User\n  |alice,One\n"
    "b: @User\n  |alice,Two\n");

  for (const bool strict : {true, false}) {
    const auto status = resolve_references(doc, strict);
    ASSERT_FALSE(status);
    EXPECT_EQ(status.error().kind, ErrorKind::Collision);
    EXPECT_NE(status.error().message.find("alice"), std::string::npos);
  }
}

TEST(SemaReferenceResolver, NestedChildrenAreRegistered)
{
  const Document doc = parse_ok(
    "%VERSION: 1.0\n%STRUCT: User: [name]\n%STRUCT: Post: [author]\n%NEST User > Post\n---\n"
    "users: @User\n"
    "  |alice,Alice\n"
    "    |p1,@User:alice\n"
    "pinned: @Post:p1\n");
  EXPECT_TRUE(resolve_references(doc, true));

  auto reg = hedl::collect_entities(doc, Limits{});
  ASSERT_TRUE(reg);
  EXPECT_TRUE(reg.value().contains("Post", "p1"));
  EXPECT_EQ(reg.value().size(), 2U);
}

TEST(SemaReferenceResolver, NestDepthGuard)
{
  const Document doc = parse_ok(
    "%VERSION: 1.0\n%STRUCT: A: [x]\n%STRUCT: B: [y]\n%NEST A > B\n---\n"
    "items: @A\n  |a1,1\n    |b1,2\n");

  Limits limits;
  limits.max_nest_depth = 0;
  const auto status = resolve_references(doc, true, limits);
  ASSERT_FALSE(status);
  EXPECT_EQ(status.error().kind, ErrorKind::Security);
}

TEST(SemaReferenceResolver, DocumentIsUnchanged)
{
  const Document doc = parse_ok(k_people);
  const Document copy = doc;
  ASSERT_TRUE(resolve_references(doc, true));
  EXPECT_EQ(doc, copy);
}
