#pragma once
#include <resonance/schema/primitives.hpp>
#include <optional>
#include <string>
#include <vector>

namespace resonance::schema {

template <uint16_t Version>
struct merkle_commitment;

template <>
struct merkle_commitment<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  hash32_t root{};
  std::vector<hash32_t> leaves;
  timestamp_milliseconds_t committed_at{};
  std::optional<std::string> anchored_ref;
};

using merkle_commitment_t = merkle_commitment<1>;

/// Last commitment accepted by the external registry.
struct anchor_record_t final {
  uint64_t sequence{};
  hash32_t root{};
  uint64_t leaf_count{};
  std::string reference;
  timestamp_milliseconds_t anchored_at{};
};

}  // namespace resonance::schema
