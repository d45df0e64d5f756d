#pragma once

#include <resonance/schema/primitives.hpp>

namespace resonance::crypto {

resonance::schema::hash32_t sha256(const resonance::schema::bytes_view_t& bytes);

/// SHA-256 over the concatenation `left || right`.
resonance::schema::hash32_t sha256(const resonance::schema::hash32_t& left,
                                   const resonance::schema::hash32_t& right);

resonance::schema::hash32_t hmac_sha256(
    const resonance::schema::key32_t& key,
    const resonance::schema::bytes_view_t& message);

/// Fill `out` from the OpenSSL CSPRNG. Returns false if the generator failed.
bool random_bytes(std::span<uint8_t> out);

}  // namespace resonance::crypto
