#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "hedl/canonical/canonical_writer.hpp"
#include "hedl/model/json_dump.hpp"
#include "hedl/syntax/parser.hpp"

using hedl::CanonicalConfig;
using hedl::Document;
using hedl::Item;
using hedl::MatrixList;
using hedl::Node;
using hedl::Object;
using hedl::QuotingStrategy;
using hedl::Reference;
using hedl::Tensor;
using hedl::Value;
using hedl::canonicalize_with_config;
using hedl::parse;

namespace
{

const char * const k_rich_document =
  "%VERSION: 1.3\n"
  "%ALIAS currency = \"EUR\"\n"
  "%STRUCT: Customer: [name, tier, balance]\n"
  "%STRUCT: Order: [total, note, items]\n"
  "%NEST Customer > Order\n"
  "---\n"
  "# customers with their orders\n"
  "customers: @Customer\n"
  "  |c1,\"Smith, Jane\",gold,120.5\n"
  "    |o1,$(qty * price),\"\",[1, 2, 3]\n"
  "    |o2,42,\"a|b\",^\n"
  "  |c2,Bob,gold,~\n"
  "  |c3,\"42\",silver,^\n"
  "settings:\n"
  "  currency: $currency\n"
  "  debug: false\n"
  "  empty:\n"
  "  motd: \"\"\"\n"
  "    Welcome!\n"
  "\n"
  "      # indented, not a comment\n"
  "    \"\"\"\n"
  "  owner: @Customer:c1\n"
  "  ratio: 0.125\n"
  "  symbols: \"~@$%[^\"\n"
  "  tabbed: \"a\\tb\"\n"
  "title: Quarterly report\n";

Document parse_ok(std::string_view src)
{
  auto doc = parse(src);
  EXPECT_TRUE(doc) << doc.error().to_string() << "\n" << src;
  return doc ? doc.value() : Document{};
}

std::string canon(const Document & doc, const CanonicalConfig & config = {})
{
  auto out = canonicalize_with_config(doc, config);
  EXPECT_TRUE(out) << out.error().to_string();
  return out ? out.value() : std::string{};
}

size_t count_rows(const std::vector<Node> & rows)
{
  size_t n = rows.size();
  for (const auto & row : rows) {
    for (const auto & [type, children] : row.children) {
      n += count_rows(children);
    }
  }
  return n;
}

}  // namespace

TEST(CanonicalRoundTrip, ParseWriteParseIsEqual)
{
  const Document original = parse_ok(k_rich_document);
  const std::string text = canon(original);
  const Document reparsed = parse_ok(text);
  EXPECT_EQ(reparsed, original) << text;
  EXPECT_EQ(hedl::to_json(reparsed), hedl::to_json(original));
}

TEST(CanonicalRoundTrip, Idempotent)
{
  const Document original = parse_ok(k_rich_document);
  const std::string first = canon(original);
  const std::string second = canon(parse_ok(first));
  EXPECT_EQ(first, second);
}

TEST(CanonicalRoundTrip, IdempotentUnderEveryConfig)
{
  const Document original = parse_ok(k_rich_document);
  for (const auto quoting : {QuotingStrategy::Minimal, QuotingStrategy::Always}) {
    for (const bool ditto : {true, false}) {
      for (const bool inline_schemas : {true, false}) {
        CanonicalConfig config;
        config.quoting = quoting;
        config.use_ditto = ditto;
        config.inline_schemas = inline_schemas;

        const std::string first = canon(original, config);
        const Document reparsed = parse_ok(first);
        EXPECT_EQ(reparsed, original) << first;
        EXPECT_EQ(canon(reparsed, config), first);
      }
    }
  }
}

TEST(CanonicalRoundTrip, PreservesStructureWithCountHints)
{
  const Document original = parse_ok(
    "%VERSION: 1.0\n%STRUCT: T: [v]\n---\n"
    "items(3): @T\n  |a,1\n  |b,1\n  |c,2\n"
    "other: x\n");
  const Document reparsed = parse_ok(canon(original));

  EXPECT_EQ(reparsed.root.size(), original.root.size());
  EXPECT_EQ(
    reparsed.root.at("items").as_list().rows, original.root.at("items").as_list().rows);
  EXPECT_EQ(count_rows(reparsed.root.at("items").as_list().rows), 3U);
}

TEST(CanonicalRoundTrip, ProgrammaticValues)
{
  MatrixList list("Sample", {"label", "reading", "shape", "link"});
  list.rows.push_back(Node(
    "Sample", "s1",
    {Value::make_string("x, y"), Value::make_float(1e-7),
     Value::make_tensor(Tensor::array({Tensor::scalar(0.5)})),
     Value::make_reference(Reference::local("s2"))}));
  list.rows.push_back(Node(
    "Sample", "s2",
    {Value::make_string("^"), Value::make_float(-0.5), Value::make_tensor(Tensor::array({})),
     Value::make_null()}));

  Object meta;
  meta.emplace("big", Item(Value::make_int(std::numeric_limits<int64_t>::min())));
  meta.emplace("huge", Item(Value::make_float(1e20)));
  meta.emplace("control", Item(Value::make_string(std::string("a\x01z", 3))));
  meta.emplace("number_like", Item(Value::make_string("-12")));
  meta.emplace("trailing_dot", Item(Value::make_string("1.")));

  Document doc;
  doc.version = {2, 0};
  doc.root.emplace("samples", Item(std::move(list)));
  doc.root.emplace("meta", Item(std::move(meta)));

  const std::string text = canon(doc);
  const Document reparsed = parse_ok(text);
  EXPECT_EQ(reparsed.root, doc.root) << text;
  EXPECT_EQ(canon(reparsed), text);
}

TEST(CanonicalRoundTrip, SignedZeroSurvivesDitto)
{
  MatrixList list("Reading", {"value"});
  list.rows.push_back(Node("Reading", "a", {Value::make_float(0.0)}));
  list.rows.push_back(Node("Reading", "b", {Value::make_float(-0.0)}));

  Document doc;
  doc.root.emplace("readings", Item(std::move(list)));

  const std::string text = canon(doc);
  EXPECT_NE(text.find("  |b,-0.0\n"), std::string::npos) << text;

  const Document reparsed = parse_ok(text);
  const auto & rows = reparsed.root.at("readings").as_list().rows;
  ASSERT_EQ(rows.size(), 2U);
  EXPECT_FALSE(std::signbit(rows[0].fields[0].as_float()));
  EXPECT_TRUE(std::signbit(rows[1].fields[0].as_float()));
}
