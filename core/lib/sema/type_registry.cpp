// hedl/sema/type_registry.cpp - Entity registry implementation
#include "hedl/sema/type_registry.hpp"

#include <fmt/core.h>

namespace hedl
{

Status TypeRegistry::register_id(std::string_view type, std::string_view id, size_t line)
{
  auto type_it = by_type_.find(type);
  if (type_it == by_type_.end()) {
    type_it = by_type_.emplace(std::string(type), IdIndex{}).first;
  }

  IdIndex & ids = type_it->second;
  auto id_it = ids.find(id);
  if (id_it != ids.end()) {
    return Status::fail(HedlError::collision(
      fmt::format(
        "duplicate ID '{}' in type '{}', previously defined at line {}", id, type,
        id_it->second),
      line));
  }

  ids.emplace(std::string(id), line);

  auto inv_it = by_id_.find(id);
  if (inv_it == by_id_.end()) {
    inv_it = by_id_.emplace(std::string(id), std::vector<std::string>{}).first;
  }
  inv_it->second.emplace_back(type);

  ++count_;
  return Status::ok();
}

bool TypeRegistry::contains(std::string_view type, std::string_view id) const
{
  return line_of(type, id).has_value();
}

std::optional<size_t> TypeRegistry::line_of(std::string_view type, std::string_view id) const
{
  auto type_it = by_type_.find(type);
  if (type_it == by_type_.end()) {
    return std::nullopt;
  }
  auto id_it = type_it->second.find(id);
  if (id_it == type_it->second.end()) {
    return std::nullopt;
  }
  return id_it->second;
}

const std::vector<std::string> & TypeRegistry::types_with_id(std::string_view id) const
{
  static const std::vector<std::string> k_none;
  auto it = by_id_.find(id);
  if (it == by_id_.end()) {
    return k_none;
  }
  return it->second;
}

const TypeRegistry::IdIndex * TypeRegistry::ids_of_type(std::string_view type) const
{
  auto it = by_type_.find(type);
  if (it == by_type_.end()) {
    return nullptr;
  }
  return &it->second;
}

}  // namespace hedl
