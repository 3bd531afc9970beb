// hedl/model/value.cpp - Value, Reference and Tensor implementation
#include "hedl/model/value.hpp"

#include <cmath>

namespace hedl
{

namespace
{

bool same_float(double a, double b) noexcept
{
  if (std::isnan(a) && std::isnan(b)) {
    return true;
  }
  return a == b;
}

}  // namespace

std::string Reference::to_ref_string() const
{
  if (type_name) {
    return "@" + *type_name + ":" + id;
  }
  return "@" + id;
}

std::vector<size_t> Tensor::shape() const
{
  std::vector<size_t> dims;
  const Tensor * cur = this;
  while (cur->is_array()) {
    dims.push_back(cur->elements().size());
    if (cur->elements().empty()) {
      break;
    }
    cur = &cur->elements().front();
  }
  return dims;
}

bool operator==(const Tensor & a, const Tensor & b)
{
  if (a.is_array_ != b.is_array_) {
    return false;
  }
  if (!a.is_array_) {
    return same_float(a.scalar_, b.scalar_);
  }
  return a.elements_ == b.elements_;
}

bool operator==(const Value & a, const Value & b)
{
  if (a.kind_ != b.kind_) {
    return false;
  }
  switch (a.kind_) {
    case ValueKind::Null:
      return true;
    case ValueKind::Bool:
      return a.as_bool() == b.as_bool();
    case ValueKind::Int:
      return a.as_int() == b.as_int();
    case ValueKind::Float:
      return same_float(a.as_float(), b.as_float());
    case ValueKind::String:
    case ValueKind::Expression:
      return a.as_string() == b.as_string();
    case ValueKind::Reference:
      return a.as_reference() == b.as_reference();
    case ValueKind::Tensor:
      return a.as_tensor() == b.as_tensor();
  }
  return false;
}

}  // namespace hedl
