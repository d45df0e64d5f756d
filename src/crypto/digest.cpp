#include <resonance/common/critical.hpp>
#include <resonance/crypto/digest.hpp>

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <memory>

namespace resonance::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

}  // namespace

resonance::schema::hash32_t sha256(
    const resonance::schema::bytes_view_t& bytes) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  auto output = resonance::schema::hash32_t{};
  auto length = 0u;
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), output.data(), &length) != 1 ||
      length != output.size()) {
    resonance::common::critical("OpenSSL SHA-256 digest failed");
  }
  return output;
}

resonance::schema::hash32_t sha256(const resonance::schema::hash32_t& left,
                                   const resonance::schema::hash32_t& right) {
  auto material = std::array<uint8_t, 64>{};
  std::copy(std::begin(left), std::end(left), std::begin(material));
  std::copy(std::begin(right), std::end(right),
            std::begin(material) + left.size());
  return sha256(resonance::schema::bytes_view_t{material.data(),
                                                material.size()});
}

resonance::schema::hash32_t hmac_sha256(
    const resonance::schema::key32_t& key,
    const resonance::schema::bytes_view_t& message) {
  auto output = resonance::schema::hash32_t{};
  auto length = 0u;
  auto* result = HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
                      message.data(), message.size(), output.data(), &length);
  if (result == nullptr || length != output.size()) {
    resonance::common::critical("OpenSSL HMAC-SHA256 failed");
  }
  return output;
}

bool random_bytes(std::span<uint8_t> out) {
  return RAND_bytes(out.data(), static_cast<int>(out.size())) == 1;
}

}  // namespace resonance::crypto
