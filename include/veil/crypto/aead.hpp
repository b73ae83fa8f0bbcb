#pragma once

#include <veil/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>

namespace veil::crypto {

using aes256_key_t = std::array<uint8_t, 32>;

inline constexpr std::size_t kGcmIvSize = 12;
inline constexpr std::size_t kGcmTagSize = 16;

/// AES-256-GCM with a fresh random IV. Output layout: iv | tag | ciphertext.
std::optional<veil::schema::bytes_t> seal(
    const aes256_key_t& key,
    const veil::schema::bytes_view_t& aad,
    const veil::schema::bytes_view_t& plaintext);

/// Inverse of seal; std::nullopt when the tag or the aad does not match.
std::optional<veil::schema::bytes_t> open(
    const aes256_key_t& key,
    const veil::schema::bytes_view_t& aad,
    const veil::schema::bytes_view_t& sealed);

}  // namespace veil::crypto
