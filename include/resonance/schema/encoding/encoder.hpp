#pragma once
#include <resonance/schema/primitives.hpp>
#include <optional>
#include <span>

namespace resonance::schema::encoding {

// Encoding backend is chosen at build time through the Library tag; there is
// no runtime switching.
template <typename Library>
struct encoder {
  template <typename T>
  resonance::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, resonance::schema::bytes_t& out);

  template <typename T>
  T decode(const resonance::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const resonance::schema::bytes_view_t& bytes);
};

}  // namespace resonance::schema::encoding
