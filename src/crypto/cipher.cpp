#include <resonance/crypto/cipher.hpp>
#include <resonance/crypto/digest.hpp>

#include <openssl/evp.h>

#include <array>
#include <memory>

namespace resonance::crypto {

namespace {

using evp_cipher_ctx_ptr =
    std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

}  // namespace

std::optional<resonance::schema::bytes_t> seal(
    const resonance::schema::key32_t& key,
    const resonance::schema::bytes_view_t& plaintext,
    const resonance::schema::bytes_view_t& associated_data,
    std::string& error) {
  auto nonce = std::array<uint8_t, kNonceSize>{};
  if (!random_bytes(nonce)) {
    error = "failed to generate nonce";
    return std::nullopt;
  }

  auto ctx = evp_cipher_ctx_ptr{EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free};
  if (!ctx ||
      EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr,
                         nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                          static_cast<int>(nonce.size()), nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(),
                         nonce.data()) != 1) {
    error = "failed to initialise AES-256-GCM";
    return std::nullopt;
  }

  auto length = 0;
  if (!associated_data.empty() &&
      EVP_EncryptUpdate(ctx.get(), nullptr, &length, associated_data.data(),
                        static_cast<int>(associated_data.size())) != 1) {
    error = "failed to authenticate associated data";
    return std::nullopt;
  }

  auto sealed = resonance::schema::bytes_t(kNonceSize + plaintext.size() +
                                           kTagSize);
  std::copy(std::begin(nonce), std::end(nonce), std::begin(sealed));
  auto* cipher_out = sealed.data() + kNonceSize;
  if (EVP_EncryptUpdate(ctx.get(), cipher_out, &length, plaintext.data(),
                        static_cast<int>(plaintext.size())) != 1) {
    error = "failed to encrypt payload";
    return std::nullopt;
  }
  auto written = length;
  if (EVP_EncryptFinal_ex(ctx.get(), cipher_out + written, &length) != 1) {
    error = "failed to finalise encryption";
    return std::nullopt;
  }
  written += length;
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                          static_cast<int>(kTagSize),
                          cipher_out + written) != 1) {
    error = "failed to read authentication tag";
    return std::nullopt;
  }
  return sealed;
}

std::optional<resonance::schema::bytes_t> open(
    const resonance::schema::key32_t& key,
    const resonance::schema::bytes_view_t& sealed,
    const resonance::schema::bytes_view_t& associated_data,
    std::string& error) {
  if (sealed.size() < kNonceSize + kTagSize) {
    error = "sealed blob is truncated";
    return std::nullopt;
  }
  auto nonce = sealed.subspan(0, kNonceSize);
  auto ciphertext =
      sealed.subspan(kNonceSize, sealed.size() - kNonceSize - kTagSize);
  auto tag = std::array<uint8_t, kTagSize>{};
  std::copy_n(sealed.data() + sealed.size() - kTagSize, kTagSize,
              std::begin(tag));

  auto ctx = evp_cipher_ctx_ptr{EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free};
  if (!ctx ||
      EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr,
                         nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                          static_cast<int>(nonce.size()), nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(),
                         nonce.data()) != 1) {
    error = "failed to initialise AES-256-GCM";
    return std::nullopt;
  }

  auto length = 0;
  if (!associated_data.empty() &&
      EVP_DecryptUpdate(ctx.get(), nullptr, &length, associated_data.data(),
                        static_cast<int>(associated_data.size())) != 1) {
    error = "failed to authenticate associated data";
    return std::nullopt;
  }

  auto plaintext = resonance::schema::bytes_t(ciphertext.size());
  if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &length,
                        ciphertext.data(),
                        static_cast<int>(ciphertext.size())) != 1) {
    error = "failed to decrypt payload";
    return std::nullopt;
  }
  auto written = length;
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                          static_cast<int>(tag.size()), tag.data()) != 1) {
    error = "failed to set authentication tag";
    return std::nullopt;
  }
  if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + written, &length) !=
      1) {
    error = "authentication failed";
    return std::nullopt;
  }
  plaintext.resize(static_cast<std::size_t>(written + length));
  return plaintext;
}

}  // namespace resonance::crypto
