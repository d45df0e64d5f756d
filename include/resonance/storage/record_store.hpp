#pragma once

#include <resonance/crypto/key_material.hpp>
#include <resonance/schema/confirmed_record.hpp>
#include <resonance/schema/primitives.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace resonance::storage {

/// Content-addressed, encrypted record persistence.
///
/// Each record lives in `<hex resonance id>.blob` inside the store
/// directory. The id is a keyed hash of the external reference, so writing
/// the same reference twice replaces the content of one blob and never
/// creates a second one. Blobs are written to a temporary sibling, synced,
/// then renamed into place; readers never observe a partial blob.
class record_store final {
 public:
  /// Open (creating when needed) the store directory. Stray temporary files
  /// from an interrupted write are removed. Directory creation failure is
  /// fatal.
  record_store(std::filesystem::path directory,
               const resonance::crypto::key_material& keys);

  /// Deterministic keyed hash of the external reference.
  resonance::schema::hash32_t derive_id(
      const std::string_view& external_ref) const;

  /// Seal and durably write the record for `external_ref`.
  ///
  /// On failure `error` describes the problem and previously written blobs
  /// are left untouched.
  std::optional<resonance::schema::put_receipt_t> put(
      const std::string_view& external_ref,
      const resonance::schema::record_payload_t& payload,
      const resonance::schema::payload_t& metadata,
      std::string& error) const;

  /// Decrypt and decode a stored record.
  std::optional<resonance::schema::confirmed_record_t> get(
      const resonance::schema::hash32_t& resonance_id,
      std::string& error) const;

  bool contains(const resonance::schema::hash32_t& resonance_id) const;

  /// Stored records with their blob digests, sorted by resonance id bytes.
  std::optional<std::vector<resonance::schema::record_leaf_t>> enumerate(
      std::string& error) const;

  /// Blob digests in the canonical order used for Merkle leaves.
  std::optional<std::vector<resonance::schema::hash32_t>> enumerate_hashes(
      std::string& error) const;

  std::size_t size() const;

  const std::filesystem::path& directory() const { return directory_; }

 private:
  std::filesystem::path blob_path(
      const resonance::schema::hash32_t& resonance_id) const;

  std::filesystem::path directory_;
  const resonance::crypto::key_material& keys_;
};

}  // namespace resonance::storage
