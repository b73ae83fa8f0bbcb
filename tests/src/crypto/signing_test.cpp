#include <gtest/gtest.h>
#include <veil/crypto/aead.hpp>
#include <veil/crypto/signing.hpp>
#include <veil/testing/common.hpp>

#include <array>
#include <vector>

namespace {

veil::crypto::ed25519_private_key_t make_seed(const uint8_t seed) {
  auto key = veil::crypto::ed25519_private_key_t{};
  for (std::size_t i = 0; i < key.size(); ++i) {
    key[i] = static_cast<uint8_t>(seed + i);
  }
  return key;
}

}  // namespace

TEST(signing, ed25519_sign_then_verify) {
  if (!veil::crypto::available()) {
    GTEST_SKIP() << "OpenSSL build lacks Ed25519";
  }
  auto private_key = make_seed(1);
  auto public_key = veil::crypto::derive_public_key(private_key);
  ASSERT_TRUE(public_key.has_value());

  auto message = std::vector<uint8_t>{'v', 'e', 'i', 'l'};
  auto signature = veil::crypto::sign(message, private_key);
  ASSERT_TRUE(signature.has_value());
  EXPECT_TRUE(veil::crypto::verify_signature(message, *public_key, *signature));
}

TEST(signing, ed25519_rejects_tampered_message_and_key) {
  if (!veil::crypto::available()) {
    GTEST_SKIP() << "OpenSSL build lacks Ed25519";
  }
  auto private_key = make_seed(1);
  auto public_key = veil::crypto::derive_public_key(private_key);
  auto other_key = veil::crypto::derive_public_key(make_seed(2));
  ASSERT_TRUE(public_key.has_value());
  ASSERT_TRUE(other_key.has_value());

  auto message = std::vector<uint8_t>{'v', 'e', 'i', 'l'};
  auto signature = veil::crypto::sign(message, private_key);
  ASSERT_TRUE(signature.has_value());

  auto tampered = message;
  tampered[0] ^= 0x01;
  EXPECT_FALSE(
      veil::crypto::verify_signature(tampered, *public_key, *signature));
  EXPECT_FALSE(veil::crypto::verify_signature(message, *other_key, *signature));
}

TEST(signing, ed25519_rejects_wrong_length_signature) {
  auto public_key = veil::crypto::ed25519_public_key_t{};
  auto message = std::vector<uint8_t>{0x01};
  auto short_signature = std::vector<uint8_t>(10, 0x00);
  EXPECT_FALSE(
      veil::crypto::verify_signature(message, public_key, short_signature));
}

TEST(aead, seal_then_open) {
  auto key = veil::crypto::aes256_key_t{};
  key.fill(0x42);
  auto aad = std::vector<uint8_t>{0x01};
  auto plaintext = std::vector<uint8_t>{'s', 'e', 'c', 'r', 'e', 't'};

  auto sealed = veil::crypto::seal(key, aad, plaintext);
  ASSERT_TRUE(sealed.has_value());
  EXPECT_EQ(sealed->size(), veil::crypto::kGcmIvSize +
                                veil::crypto::kGcmTagSize + plaintext.size());
  EXPECT_EQ(veil::crypto::open(key, aad, *sealed), plaintext);
}

TEST(aead, open_fails_on_wrong_aad_key_or_tamper) {
  auto key = veil::crypto::aes256_key_t{};
  key.fill(0x42);
  auto aad = std::vector<uint8_t>{0x01};
  auto plaintext = std::vector<uint8_t>{1, 2, 3, 4, 5, 6, 7, 8};
  auto sealed = veil::crypto::seal(key, aad, plaintext);
  ASSERT_TRUE(sealed.has_value());

  EXPECT_FALSE(
      veil::crypto::open(key, std::vector<uint8_t>{0x00}, *sealed).has_value());

  auto other_key = key;
  other_key[0] ^= 0xFF;
  EXPECT_FALSE(veil::crypto::open(other_key, aad, *sealed).has_value());

  auto tampered = *sealed;
  tampered.back() ^= 0x01;
  EXPECT_FALSE(veil::crypto::open(key, aad, tampered).has_value());

  EXPECT_FALSE(
      veil::crypto::open(key, aad, std::vector<uint8_t>(4, 0)).has_value());
}

TEST(aead, fresh_iv_per_seal) {
  auto key = veil::crypto::aes256_key_t{};
  auto aad = std::vector<uint8_t>{};
  auto plaintext = std::vector<uint8_t>{9, 9, 9};
  auto first = veil::crypto::seal(key, aad, plaintext);
  auto second = veil::crypto::seal(key, aad, plaintext);
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_NE(*first, *second);
}
