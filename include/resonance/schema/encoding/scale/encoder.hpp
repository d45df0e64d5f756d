#pragma once
#include <resonance/common/critical.hpp>
#include <resonance/schema/confirmed_record.hpp>
#include <resonance/schema/encoding/encoder.hpp>
#include <resonance/schema/instant_marker.hpp>
#include <resonance/schema/merkle_commitment.hpp>
#include <resonance/schema/supply_state.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace resonance::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  resonance::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, resonance::schema::bytes_t& out);

  template <typename T>
  T decode(const resonance::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const resonance::schema::bytes_view_t& bytes);
};

template <typename T>
resonance::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    resonance::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        resonance::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const resonance::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    resonance::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const resonance::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace resonance::schema::encoding

namespace resonance::schema {

using scale_encoder_t =
    encoding::encoder<encoding::scale_encoder_tag>;

}  // namespace resonance::schema
