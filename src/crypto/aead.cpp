#include <veil/crypto/aead.hpp>
#include <veil/crypto/signing.hpp>

#include <openssl/evp.h>

#include <algorithm>
#include <iterator>
#include <memory>

namespace veil::crypto {

namespace {

using evp_cipher_ctx_ptr =
    std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

}  // namespace

std::optional<veil::schema::bytes_t> seal(
    const aes256_key_t& key,
    const veil::schema::bytes_view_t& aad,
    const veil::schema::bytes_view_t& plaintext) {
  auto iv = std::array<uint8_t, kGcmIvSize>{};
  if (!random_bytes(iv)) {
    return std::nullopt;
  }

  auto ctx = evp_cipher_ctx_ptr{EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free};
  if (!ctx) {
    return std::nullopt;
  }
  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr,
                         nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                          static_cast<int>(iv.size()), nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(),
                         iv.data()) != 1) {
    return std::nullopt;
  }

  auto length = 0;
  if (!aad.empty() &&
      EVP_EncryptUpdate(ctx.get(), nullptr, &length, aad.data(),
                        static_cast<int>(aad.size())) != 1) {
    return std::nullopt;
  }

  auto sealed = veil::schema::bytes_t(kGcmIvSize + kGcmTagSize +
                                      plaintext.size() + kGcmTagSize);
  auto* body = sealed.data() + kGcmIvSize + kGcmTagSize;
  auto written = 0;
  if (!plaintext.empty()) {
    if (EVP_EncryptUpdate(ctx.get(), body, &length, plaintext.data(),
                          static_cast<int>(plaintext.size())) != 1) {
      return std::nullopt;
    }
    written = length;
  }
  if (EVP_EncryptFinal_ex(ctx.get(), body + written, &length) != 1) {
    return std::nullopt;
  }
  written += length;

  std::copy(std::begin(iv), std::end(iv), std::begin(sealed));
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                          static_cast<int>(kGcmTagSize),
                          sealed.data() + kGcmIvSize) != 1) {
    return std::nullopt;
  }
  sealed.resize(kGcmIvSize + kGcmTagSize + static_cast<std::size_t>(written));
  return sealed;
}

std::optional<veil::schema::bytes_t> open(
    const aes256_key_t& key,
    const veil::schema::bytes_view_t& aad,
    const veil::schema::bytes_view_t& sealed) {
  if (sealed.size() < kGcmIvSize + kGcmTagSize) {
    return std::nullopt;
  }
  const auto* iv = sealed.data();
  auto tag = std::array<uint8_t, kGcmTagSize>{};
  std::copy_n(sealed.data() + kGcmIvSize, kGcmTagSize, std::begin(tag));
  const auto* body = sealed.data() + kGcmIvSize + kGcmTagSize;
  const auto body_size = sealed.size() - kGcmIvSize - kGcmTagSize;

  auto ctx = evp_cipher_ctx_ptr{EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free};
  if (!ctx) {
    return std::nullopt;
  }
  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr,
                         nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                          static_cast<int>(kGcmIvSize), nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv) != 1) {
    return std::nullopt;
  }

  auto length = 0;
  if (!aad.empty() &&
      EVP_DecryptUpdate(ctx.get(), nullptr, &length, aad.data(),
                        static_cast<int>(aad.size())) != 1) {
    return std::nullopt;
  }

  auto plaintext = veil::schema::bytes_t(body_size + kGcmTagSize);
  auto written = 0;
  if (body_size > 0) {
    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &length, body,
                          static_cast<int>(body_size)) != 1) {
      return std::nullopt;
    }
    written = length;
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                          static_cast<int>(kGcmTagSize), tag.data()) != 1) {
    return std::nullopt;
  }
  if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + written, &length) !=
      1) {
    return std::nullopt;
  }
  written += length;
  plaintext.resize(static_cast<std::size_t>(written));
  return plaintext;
}

}  // namespace veil::crypto
