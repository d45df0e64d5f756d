#pragma once
#include <resonance/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace resonance::schema::key {

/// Assembles a RocksDB key: a namespace prefix such as `MARKER|` followed by
/// raw components.
struct builder final {
  explicit builder(const std::string_view& prefix = {});

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);

  resonance::schema::bytes_view_t view() const;

  resonance::schema::bytes_t data;
};

}  // namespace resonance::schema::key
