#include <gtest/gtest.h>

#include "hedl/model/document.hpp"

using hedl::Document;
using hedl::Item;
using hedl::ItemKind;
using hedl::MatrixList;
using hedl::Node;
using hedl::Object;
using hedl::Value;

TEST(ModelDocument, NodeEqualityIgnoresLine)
{
  Node a("User", "alice", {Value::make_string("Alice")});
  Node b = a;
  a.line = 3;
  b.line = 40;
  EXPECT_EQ(a, b);

  b.fields[0] = Value::make_string("Bob");
  EXPECT_NE(a, b);
}

TEST(ModelDocument, ItemKinds)
{
  const Item scalar(Value::make_int(1));
  const Item list(MatrixList("User", {"name"}));
  const Item object(Object{});

  EXPECT_EQ(scalar.kind(), ItemKind::Scalar);
  EXPECT_TRUE(list.is_list());
  EXPECT_TRUE(object.is_object());
  EXPECT_EQ(list.as_list().schema.size(), 1U);
}

TEST(ModelDocument, NestedObjectsCompare)
{
  Object inner;
  inner.emplace("port", Item(Value::make_int(80)));
  Object outer;
  outer.emplace("server", Item(inner));

  Document a;
  a.root = outer;
  Document b;
  b.root = outer;
  EXPECT_EQ(a, b);

  b.root["server"].as_object()["port"] = Item(Value::make_int(81));
  EXPECT_NE(a, b);
}

TEST(ModelDocument, SchemaAndNestLookup)
{
  Document doc;
  doc.structs["User"] = {"name", "email"};
  doc.structs["Post"] = {"title"};
  doc.nests["User"] = "Post";

  ASSERT_NE(doc.get_schema("User"), nullptr);
  EXPECT_EQ(doc.get_schema("User")->size(), 2U);
  EXPECT_EQ(doc.get_schema("Comment"), nullptr);

  ASSERT_NE(doc.get_child_type("User"), nullptr);
  EXPECT_EQ(*doc.get_child_type("User"), "Post");
  EXPECT_EQ(doc.get_child_type("Post"), nullptr);
}

TEST(ModelDocument, VersionDefaultsToOneZero)
{
  const Document doc;
  EXPECT_EQ(doc.version.first, 1U);
  EXPECT_EQ(doc.version.second, 0U);
  EXPECT_TRUE(doc.root.empty());
}
