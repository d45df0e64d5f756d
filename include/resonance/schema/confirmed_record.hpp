#pragma once
#include <resonance/schema/primitives.hpp>
#include <string>

namespace resonance::schema {

template <uint16_t Version>
struct confirmed_record;

/// Plaintext of an encrypted record blob.
template <>
struct confirmed_record<1> final {
  uint16_t version{1};
  hash32_t resonance_id{};
  std::string external_ref;
  std::string from_party;
  std::string to_party;
  amount_t value{};
  uint64_t cursor_position{};
  timestamp_milliseconds_t created_at{};
  payload_t metadata;
};

using confirmed_record_t = confirmed_record<1>;

/// Transfer fields sealed into a record alongside its metadata.
struct record_payload_t final {
  std::string from_party;
  std::string to_party;
  amount_t value{};
  uint64_t cursor_position{};
};

/// Result of a successful record store write.
struct put_receipt_t final {
  hash32_t resonance_id{};
  hash32_t blob_digest{};
};

/// One Merkle leaf candidate: a stored record and the digest of its blob.
struct record_leaf_t final {
  hash32_t resonance_id{};
  hash32_t blob_digest{};
};

}  // namespace resonance::schema
