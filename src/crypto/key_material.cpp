#include <resonance/crypto/digest.hpp>
#include <resonance/crypto/key_material.hpp>

#include <openssl/crypto.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

namespace resonance::crypto {

namespace {

constexpr auto kKeyFileBytes = std::size_t{64};

bool is_zero(const resonance::schema::key32_t& key) {
  return std::all_of(std::begin(key), std::end(key),
                     [](const uint8_t b) { return b == 0; });
}

}  // namespace

key_material::key_material(const resonance::schema::key32_t& identity_key,
                           const resonance::schema::key32_t& encryption_key)
    : identity_key_{identity_key}, encryption_key_{encryption_key} {}

key_material::~key_material() {
  wipe();
}

key_material::key_material(key_material&& other) noexcept
    : identity_key_{other.identity_key_},
      encryption_key_{other.encryption_key_} {
  other.wipe();
}

key_material& key_material::operator=(key_material&& other) noexcept {
  if (this != &other) {
    identity_key_ = other.identity_key_;
    encryption_key_ = other.encryption_key_;
    other.wipe();
  }
  return *this;
}

void key_material::wipe() {
  OPENSSL_cleanse(identity_key_.data(), identity_key_.size());
  OPENSSL_cleanse(encryption_key_.data(), encryption_key_.size());
}

std::optional<key_material> key_material::load(
    const std::filesystem::path& path,
    std::string& error) {
  auto stream = std::ifstream{path};
  if (!stream) {
    error = "key file '" + path.string() + "' is missing or unreadable";
    return std::nullopt;
  }
  auto raw = std::stringstream{};
  raw << stream.rdbuf();

  auto hex = std::string{};
  for (const auto ch : raw.str()) {
    if (std::isspace(static_cast<unsigned char>(ch)) == 0) {
      hex.push_back(ch);
    }
  }
  auto decoded = resonance::schema::try_from_hex(hex);
  if (!decoded) {
    error = "key file '" + path.string() + "' is not valid hex";
    return std::nullopt;
  }
  if (decoded->size() != kKeyFileBytes) {
    error = "key file '" + path.string() + "' must hold exactly 64 bytes";
    OPENSSL_cleanse(decoded->data(), decoded->size());
    return std::nullopt;
  }

  auto identity = resonance::schema::key32_t{};
  auto encryption = resonance::schema::key32_t{};
  std::copy_n(decoded->data(), identity.size(), std::begin(identity));
  std::copy_n(decoded->data() + identity.size(), encryption.size(),
              std::begin(encryption));
  OPENSSL_cleanse(decoded->data(), decoded->size());
  OPENSSL_cleanse(hex.data(), hex.size());

  if (is_zero(identity) || is_zero(encryption)) {
    error = "key file '" + path.string() + "' holds an all-zero key";
    return std::nullopt;
  }
  return key_material{identity, encryption};
}

std::optional<key_material> key_material::generate(std::string& error) {
  auto identity = resonance::schema::key32_t{};
  auto encryption = resonance::schema::key32_t{};
  if (!random_bytes(identity) || !random_bytes(encryption)) {
    error = "OpenSSL random generator failed";
    return std::nullopt;
  }
  auto keys = key_material{identity, encryption};
  OPENSSL_cleanse(identity.data(), identity.size());
  OPENSSL_cleanse(encryption.data(), encryption.size());
  return keys;
}

bool key_material::save(const std::filesystem::path& path,
                        const bool overwrite,
                        std::string& error) const {
  auto ec = std::error_code{};
  if (!overwrite && std::filesystem::exists(path, ec)) {
    error = "refusing to overwrite existing key file '" + path.string() + "'";
    return false;
  }

  {
    auto stream = std::ofstream{path, std::ios::trunc};
    if (!stream) {
      error = "failed to open '" + path.string() + "' for writing";
      return false;
    }
    stream << resonance::schema::to_hex(identity_key_)
           << resonance::schema::to_hex(encryption_key_) << '\n';
    if (!stream.flush()) {
      error = "failed to write key file '" + path.string() + "'";
      return false;
    }
  }

  std::filesystem::permissions(path,
                               std::filesystem::perms::owner_read |
                                   std::filesystem::perms::owner_write,
                               std::filesystem::perm_options::replace, ec);
  if (ec) {
    error = "failed to restrict permissions on '" + path.string() +
            "': " + ec.message();
    return false;
  }
  return true;
}

}  // namespace resonance::crypto
