#include <resonance/blake3/hash.hpp>

namespace resonance::blake3 {

hasher::hasher() {
  blake3_hasher_init(&state_);
}

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_, str.data(), str.size());
  return *this;
}

hasher& hasher::update(const std::span<const uint8_t>& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

resonance::schema::hash32_t hasher::finalize() const {
  auto output = resonance::schema::hash32_t{};
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

resonance::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

resonance::schema::hash32_t hash(const std::span<const uint8_t>& bytes) {
  return hasher{}.update(bytes).finalize();
}

}  // namespace resonance::blake3
