#pragma once
#include <blake3.h>
#include <resonance/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace resonance::blake3 {

/// Incremental BLAKE3. Integers are absorbed little-endian so ids derived
/// from (salt, sequence, time, payload) are stable across hosts.
class hasher final {
 public:
  hasher();

  hasher& update(const std::string_view& str);
  hasher& update(const std::span<const uint8_t>& bytes);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  hasher& update(T value) {
    auto bytes = std::array<uint8_t, sizeof(T)>{};
    for (size_t i = 0; i < sizeof(T); ++i) {
      bytes[i] = static_cast<uint8_t>((value >> (i * 8)) & 0xFF);
    }
    return update(std::span<const uint8_t>{bytes.data(), bytes.size()});
  }

  resonance::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_;
};

resonance::schema::hash32_t hash(const std::string_view& str);
resonance::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

}  // namespace resonance::blake3
