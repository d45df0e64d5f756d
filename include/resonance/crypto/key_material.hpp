#pragma once

#include <resonance/schema/primitives.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace resonance::crypto {

/// Process-wide secrets: the identity key used to derive resonance ids and
/// the symmetric key used to seal record blobs.
///
/// Loaded once at startup from an externally supplied file holding 64 bytes
/// as hex (identity key first). Move-only; key bytes are wiped on
/// destruction.
class key_material final {
 public:
  key_material(const resonance::schema::key32_t& identity_key,
               const resonance::schema::key32_t& encryption_key);
  ~key_material();

  key_material(const key_material&) = delete;
  key_material& operator=(const key_material&) = delete;
  key_material(key_material&& other) noexcept;
  key_material& operator=(key_material&& other) noexcept;

  /// Read and validate a key file. Missing, malformed or all-zero keys fail.
  static std::optional<key_material> load(const std::filesystem::path& path,
                                          std::string& error);

  /// Draw fresh keys from the OpenSSL CSPRNG.
  static std::optional<key_material> generate(std::string& error);

  /// Write the key file with owner-only permissions. Refuses to replace an
  /// existing file unless `overwrite` is set.
  bool save(const std::filesystem::path& path,
            bool overwrite,
            std::string& error) const;

  const resonance::schema::key32_t& identity_key() const {
    return identity_key_;
  }
  const resonance::schema::key32_t& encryption_key() const {
    return encryption_key_;
  }

 private:
  void wipe();

  resonance::schema::key32_t identity_key_{};
  resonance::schema::key32_t encryption_key_{};
};

}  // namespace resonance::crypto
