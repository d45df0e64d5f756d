#pragma once

#include <resonance/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace resonance::schema {

enum class error_code_t : uint8_t {
  ok = 0,
  transient_network_error = 1,
  storage_write_failure = 2,
  storage_read_failure = 3,
  key_unavailable = 4,
  circuit_open = 5,
  cancelled = 6,
  malformed_event = 7
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code_t>{"ok", error_code_t::ok},
    std::pair<std::string_view, error_code_t>{
        "transient_network_error", error_code_t::transient_network_error},
    std::pair<std::string_view, error_code_t>{
        "storage_write_failure", error_code_t::storage_write_failure},
    std::pair<std::string_view, error_code_t>{
        "storage_read_failure", error_code_t::storage_read_failure},
    std::pair<std::string_view, error_code_t>{"key_unavailable",
                                              error_code_t::key_unavailable},
    std::pair<std::string_view, error_code_t>{"circuit_open",
                                              error_code_t::circuit_open},
    std::pair<std::string_view, error_code_t>{"cancelled",
                                              error_code_t::cancelled},
    std::pair<std::string_view, error_code_t>{"malformed_event",
                                              error_code_t::malformed_event}};

template <>
inline std::optional<error_code_t> try_from_string<error_code_t>(
    const std::string_view value) {
  return from_string(value, kErrorCodeMappings);
}

inline constexpr std::string_view to_string(const error_code_t value) {
  return name_of(value, kErrorCodeMappings);
}

}  // namespace resonance::schema
