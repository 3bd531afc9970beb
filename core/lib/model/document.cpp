// hedl/model/document.cpp - Document lookups
#include "hedl/model/document.hpp"

namespace hedl
{

const std::vector<std::string> * Document::get_schema(std::string_view type) const
{
  auto it = structs.find(type);
  if (it == structs.end()) {
    return nullptr;
  }
  return &it->second;
}

const std::string * Document::get_child_type(std::string_view parent) const
{
  auto it = nests.find(parent);
  if (it == nests.end()) {
    return nullptr;
  }
  return &it->second;
}

}  // namespace hedl
