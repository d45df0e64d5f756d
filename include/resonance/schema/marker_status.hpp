#pragma once

#include <resonance/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Instant marker lifecycle. The only transition is pending -> confirmed.
namespace resonance::schema {

enum class marker_status_t : uint8_t { pending = 0, confirmed = 1 };

inline constexpr auto kMarkerStatusMappings =
    std::array{std::pair<std::string_view, marker_status_t>{
                   "PENDING", marker_status_t::pending},
               std::pair<std::string_view, marker_status_t>{
                   "CONFIRMED", marker_status_t::confirmed}};

template <>
inline std::optional<marker_status_t> try_from_string<marker_status_t>(
    const std::string_view value) {
  return from_string(value, kMarkerStatusMappings);
}

inline constexpr std::string_view to_string(const marker_status_t value) {
  return name_of(value, kMarkerStatusMappings);
}

}  // namespace resonance::schema
