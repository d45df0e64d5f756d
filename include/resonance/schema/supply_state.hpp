#pragma once

#include <resonance/schema/enum_string.hpp>
#include <resonance/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace resonance::schema {

enum class burn_status_t : uint8_t { not_triggered = 0, triggered = 1 };

inline constexpr auto kBurnStatusMappings =
    std::array{std::pair<std::string_view, burn_status_t>{
                   "NOT_TRIGGERED", burn_status_t::not_triggered},
               std::pair<std::string_view, burn_status_t>{
                   "TRIGGERED", burn_status_t::triggered}};

template <>
inline std::optional<burn_status_t> try_from_string<burn_status_t>(
    const std::string_view value) {
  return from_string(value, kBurnStatusMappings);
}

inline constexpr std::string_view to_string(const burn_status_t value) {
  return name_of(value, kBurnStatusMappings);
}

inline const auto kDefaultTotalSupply = amount_t{1'021'000'000};
inline const auto kDefaultBurnTarget = amount_t{1'000'000'000};

struct supply_state_t final {
  amount_t circulating_supply{};
  amount_t burned_total{};
  amount_t burn_target{kDefaultBurnTarget};
  amount_t total_supply{kDefaultTotalSupply};
  burn_status_t status{burn_status_t::not_triggered};
};

}  // namespace resonance::schema
