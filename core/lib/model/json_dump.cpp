// hedl/model/json_dump.cpp - JSON serialization implementation
//
#include "hedl/model/json_dump.hpp"

#include <string>

namespace hedl
{
namespace
{

using nlohmann::json;

// Forward declarations
json j_object(const Object & object);
json j_rows(const std::vector<Node> & rows);

json j_tensor(const Tensor & t)
{
  if (t.is_scalar()) {
    return t.scalar_value();
  }
  json arr = json::array();
  for (const auto & e : t.elements()) {
    arr.push_back(j_tensor(e));
  }
  return arr;
}

json j_node(const Node & node)
{
  json fields = json::array();
  for (const auto & v : node.fields) {
    fields.push_back(to_json(v));
  }

  json j{{"type", node.type_name}, {"id", node.id}, {"fields", std::move(fields)}};
  if (node.child_count) {
    j["child_count"] = *node.child_count;
  }
  if (!node.children.empty()) {
    json children = json::object();
    for (const auto & [type, rows] : node.children) {
      children[type] = j_rows(rows);
    }
    j["children"] = std::move(children);
  }
  return j;
}

json j_rows(const std::vector<Node> & rows)
{
  json arr = json::array();
  for (const auto & node : rows) {
    arr.push_back(j_node(node));
  }
  return arr;
}

json j_list(const MatrixList & list)
{
  json j{{"list", list.type_name}, {"schema", list.schema}, {"rows", j_rows(list.rows)}};
  if (list.count_hint) {
    j["count_hint"] = *list.count_hint;
  }
  return j;
}

json j_item(const Item & item)
{
  switch (item.kind()) {
    case ItemKind::Scalar:
      return to_json(item.as_scalar());
    case ItemKind::List:
      return j_list(item.as_list());
    case ItemKind::Object:
      return json{{"object", j_object(item.as_object())}};
  }
  return nullptr;
}

json j_object(const Object & object)
{
  json j = json::object();
  for (const auto & [key, item] : object) {
    j[key] = j_item(item);
  }
  return j;
}

}  // namespace

json to_json(const Value & value)
{
  json j{{"kind", std::string(to_string(value.kind()))}};

  switch (value.kind()) {
    case ValueKind::Null:
      break;
    case ValueKind::Bool:
      j["value"] = value.as_bool();
      break;
    case ValueKind::Int:
      j["value"] = value.as_int();
      break;
    case ValueKind::Float:
      j["value"] = value.as_float();
      break;
    case ValueKind::String:
    case ValueKind::Expression:
      j["value"] = value.as_string();
      break;
    case ValueKind::Reference: {
      const auto & ref = value.as_reference();
      j["type"] = ref.type_name ? json(*ref.type_name) : json(nullptr);
      j["id"] = ref.id;
      break;
    }
    case ValueKind::Tensor:
      j["value"] = j_tensor(value.as_tensor());
      break;
  }
  return j;
}

json to_json(const Document & doc)
{
  json structs = json::object();
  for (const auto & [type, cols] : doc.structs) {
    structs[type] = cols;
  }

  json aliases = json::object();
  for (const auto & [name, text] : doc.aliases) {
    aliases[name] = text;
  }

  json nests = json::object();
  for (const auto & [parent, child] : doc.nests) {
    nests[parent] = child;
  }

  return json{
    {"version", std::to_string(doc.version.first) + "." + std::to_string(doc.version.second)},
    {"aliases", std::move(aliases)},
    {"structs", std::move(structs)},
    {"nests", std::move(nests)},
    {"root", j_object(doc.root)}};
}

}  // namespace hedl
