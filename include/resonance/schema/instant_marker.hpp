#pragma once
#include <resonance/schema/marker_status.hpp>
#include <resonance/schema/primitives.hpp>
#include <optional>
#include <string>

namespace resonance::schema {

template <uint16_t Version>
struct instant_marker;

template <>
struct instant_marker<1> final {
  uint16_t version{1};
  hash32_t marker_id{};
  uint64_t sequence{};
  marker_status_t status{marker_status_t::pending};
  std::optional<std::string> external_ref;
  payload_t payload;
  timestamp_milliseconds_t created_at{};
  std::optional<timestamp_milliseconds_t> confirmed_at;
  // Created directly in the confirmed state from an external-first event.
  bool synthesized{false};
};

using instant_marker_t = instant_marker<1>;

}  // namespace resonance::schema
