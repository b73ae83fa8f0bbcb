#include <veil/crypto/signing.hpp>

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <memory>

namespace veil::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

bool openssl_has_ed25519() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx) {
    return false;
  }
  return true;
}

evp_pkey_ptr load_private_key(const ed25519_private_key_t& private_key) {
  return evp_pkey_ptr{
      EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                   private_key.data(), private_key.size()),
      EVP_PKEY_free};
}

}  // namespace

bool available() {
  static const auto available_now = openssl_has_ed25519();
  return available_now;
}

bool random_bytes(std::span<uint8_t> out) {
  if (out.empty()) {
    return true;
  }
  return RAND_bytes(out.data(), static_cast<int>(out.size())) == 1;
}

std::optional<ed25519_public_key_t> derive_public_key(
    const ed25519_private_key_t& private_key) {
  auto pkey = load_private_key(private_key);
  if (!pkey) {
    return std::nullopt;
  }
  auto public_key = ed25519_public_key_t{};
  auto length = public_key.size();
  if (EVP_PKEY_get_raw_public_key(pkey.get(), public_key.data(), &length) !=
          1 ||
      length != public_key.size()) {
    return std::nullopt;
  }
  return public_key;
}

std::optional<ed25519_signature_t> sign(
    const veil::schema::bytes_view_t& message,
    const ed25519_private_key_t& private_key) {
  auto pkey = load_private_key(private_key);
  if (!pkey) {
    return std::nullopt;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return std::nullopt;
  }

  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) !=
      1) {
    return std::nullopt;
  }
  auto signature = ed25519_signature_t{};
  auto length = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &length, message.data(),
                     message.size()) != 1 ||
      length != signature.size()) {
    return std::nullopt;
  }
  return signature;
}

bool verify_signature(const veil::schema::bytes_view_t& message,
                      const ed25519_public_key_t& public_key,
                      const veil::schema::bytes_view_t& signature) {
  if (signature.size() != std::tuple_size_v<ed25519_signature_t>) {
    return false;
  }

  auto pkey = evp_pkey_ptr{
      EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(),
                                  public_key.size()),
      EVP_PKEY_free};
  if (!pkey) {
    return false;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) ==
      1) {
    ok = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
  }
  return ok;
}

}  // namespace veil::crypto
