// hedl/canonical/canonical_config.cpp - Canonical writer options
#include "hedl/canonical/canonical_config.hpp"

namespace hedl
{

std::optional<QuotingStrategy> quoting_from_string(std::string_view s) noexcept
{
  if (s == "minimal") {
    return QuotingStrategy::Minimal;
  }
  if (s == "always") {
    return QuotingStrategy::Always;
  }
  return std::nullopt;
}

std::string_view to_string(QuotingStrategy q) noexcept
{
  switch (q) {
    case QuotingStrategy::Minimal:
      return "minimal";
    case QuotingStrategy::Always:
      return "always";
  }
  return "unknown";
}

}  // namespace hedl
