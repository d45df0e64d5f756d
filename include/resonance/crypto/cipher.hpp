#pragma once

#include <resonance/schema/primitives.hpp>

#include <optional>
#include <string>

// AES-256-GCM sealing for record blobs.
// Sealed layout: nonce (12) || ciphertext || tag (16).
namespace resonance::crypto {

inline constexpr auto kNonceSize = std::size_t{12};
inline constexpr auto kTagSize = std::size_t{16};

std::optional<resonance::schema::bytes_t> seal(
    const resonance::schema::key32_t& key,
    const resonance::schema::bytes_view_t& plaintext,
    const resonance::schema::bytes_view_t& associated_data,
    std::string& error);

/// Returns std::nullopt when the blob is malformed or fails authentication.
std::optional<resonance::schema::bytes_t> open(
    const resonance::schema::key32_t& key,
    const resonance::schema::bytes_view_t& sealed,
    const resonance::schema::bytes_view_t& associated_data,
    std::string& error);

}  // namespace resonance::crypto
