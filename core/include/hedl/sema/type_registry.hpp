// hedl/sema/type_registry.hpp - Dual-indexed (type, id) entity registry
//
// Built fresh for each resolution pass and discarded afterwards.
//
#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "hedl/basic/error.hpp"

namespace hedl
{

/**
 * Registry of every entity in a document.
 *
 * Two indices over the same (type, id, line) facts are kept in sync on
 * every registration:
 * - forward:  type -> (id -> line)
 * - inverted: id -> [type], in registration order
 */
class TypeRegistry
{
public:
  using IdIndex = std::map<std::string, size_t, std::less<>>;

  /**
   * Register an entity.
   *
   * @return Collision error if (type, id) is already registered
   */
  [[nodiscard]] Status register_id(std::string_view type, std::string_view id, size_t line);

  [[nodiscard]] bool contains(std::string_view type, std::string_view id) const;

  /// Line where (type, id) was registered
  [[nodiscard]] std::optional<size_t> line_of(std::string_view type, std::string_view id) const;

  /// Types that contain `id` (empty when none)
  [[nodiscard]] const std::vector<std::string> & types_with_id(std::string_view id) const;

  /// Forward index of one type, nullptr when the type has no entities
  [[nodiscard]] const IdIndex * ids_of_type(std::string_view type) const;

  [[nodiscard]] size_t size() const noexcept { return count_; }
  [[nodiscard]] bool empty() const noexcept { return count_ == 0; }

private:
  std::map<std::string, IdIndex, std::less<>> by_type_;
  std::map<std::string, std::vector<std::string>, std::less<>> by_id_;
  size_t count_ = 0;
};

}  // namespace hedl
