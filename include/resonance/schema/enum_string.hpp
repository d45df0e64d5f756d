#pragma once

#include <boost/algorithm/string/predicate.hpp>

#include <array>
#include <optional>
#include <string_view>
#include <utility>

// Name tables for enums that cross a boundary: logs, the control surface and
// operator-supplied configuration.
namespace resonance::schema {

template <typename Enum>
using enum_mapping_t = std::pair<std::string_view, Enum>;

/// Case-insensitive lookup, so "confirmed" and "CONFIRMED" both parse.
template <typename Enum, std::size_t N>
std::optional<Enum> from_string(
    const std::string_view value,
    const std::array<enum_mapping_t<Enum>, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (boost::algorithm::iequals(name, value)) {
      return enum_value;
    }
  }
  return std::nullopt;
}

/// Canonical name of `value`; "unknown" for a value missing from the table.
template <typename Enum, std::size_t N>
constexpr std::string_view name_of(
    const Enum value,
    const std::array<enum_mapping_t<Enum>, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return "unknown";
}

/// Specialized next to each enum that can be parsed.
template <typename Enum>
std::optional<Enum> try_from_string(std::string_view value);

}  // namespace resonance::schema
