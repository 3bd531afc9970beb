#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "hedl/driver/engine.hpp"

namespace fs = std::filesystem;

using hedl::ErrorKind;
using hedl::ParseOptions;
using hedl::parse_file;
using hedl::parse_with_options;

namespace
{

const char * const k_dangling =
  "%VERSION: 1.0\n%STRUCT: User: [name]\n---\n"
  "users: @User\n  |alice,Alice\n"
  "owner: @ghost\n";

}  // namespace

TEST(ProjectEngine, ResolutionIsOptIn)
{
  ParseOptions options;
  EXPECT_TRUE(parse_with_options(k_dangling, options));

  options.resolve_refs = true;
  auto strict = parse_with_options(k_dangling, options);
  ASSERT_FALSE(strict);
  EXPECT_EQ(strict.error().kind, ErrorKind::Reference);

  options.strict_refs = false;
  EXPECT_TRUE(parse_with_options(k_dangling, options));
}

TEST(ProjectEngine, LimitsArePassedThrough)
{
  ParseOptions options;
  options.limits.max_nodes = 0;
  auto doc = parse_with_options(k_dangling, options);
  ASSERT_FALSE(doc);
  EXPECT_EQ(doc.error().kind, ErrorKind::Security);
}

TEST(ProjectEngine, ParseFile)
{
  const fs::path path = fs::temp_directory_path() / "hedl_engine_test.hedl";
  std::ofstream(path) << "%VERSION: 1.0\n---\nname: test\n";

  auto doc = parse_file(path);
  ASSERT_TRUE(doc) << doc.error().to_string();
  EXPECT_EQ(doc.value().root.size(), 1U);

  ParseOptions tiny;
  tiny.limits.max_file_size = 4;
  auto too_big = parse_file(path, tiny);
  ASSERT_FALSE(too_big);
  EXPECT_EQ(too_big.error().kind, ErrorKind::Security);

  std::error_code ec;
  fs::remove(path, ec);
}

TEST(ProjectEngine, MissingFileIsIoError)
{
  auto doc = parse_file(fs::temp_directory_path() / "hedl_does_not_exist.hedl");
  ASSERT_FALSE(doc);
  EXPECT_EQ(doc.error().kind, ErrorKind::IO);
}
