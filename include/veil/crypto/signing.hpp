#pragma once

#include <veil/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <span>

namespace veil::crypto {

using ed25519_public_key_t = std::array<uint8_t, 32>;
using ed25519_private_key_t = std::array<uint8_t, 32>;  // raw RFC 8032 seed
using ed25519_signature_t = std::array<uint8_t, 64>;

bool available();

/// Fill `out` from the OpenSSL CSPRNG.
bool random_bytes(std::span<uint8_t> out);

std::optional<ed25519_public_key_t> derive_public_key(
    const ed25519_private_key_t& private_key);

std::optional<ed25519_signature_t> sign(
    const veil::schema::bytes_view_t& message,
    const ed25519_private_key_t& private_key);

bool verify_signature(const veil::schema::bytes_view_t& message,
                      const ed25519_public_key_t& public_key,
                      const veil::schema::bytes_view_t& signature);

}  // namespace veil::crypto
