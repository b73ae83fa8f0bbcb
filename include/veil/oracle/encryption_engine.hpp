#pragma once

#include <veil/schema/ciphertext.hpp>
#include <veil/schema/primitives.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace veil::oracle {

using cleartexts_t = std::vector<veil::schema::bytes_t>;

/// Handler the oracle invokes when a decryption completes. May be called from
/// any thread, in any order relative to other requests.
using decryption_callback_t =
    std::function<void(const veil::schema::request_token_t& token,
                       const cleartexts_t& cleartexts,
                       const veil::schema::bytes_t& proof)>;

/// Homomorphic-encryption service consumed by the ledger.
///
/// The ledger never sees key material; it only routes envelopes through these
/// callbacks. Every member must be set before the engine is handed to the
/// ledger.
struct encryption_engine final {
  std::function<veil::schema::ciphertext_t()> encrypt_zero;

  /// Encrypted constant, used for the count increment.
  std::function<veil::schema::ciphertext_t(uint64_t)> encrypt_uint64;

  /// std::nullopt when either operand is not a well-formed euint64 handle.
  std::function<std::optional<veil::schema::ciphertext_t>(
      const veil::schema::ciphertext_t&,
      const veil::schema::ciphertext_t&)>
      homomorphic_add;

  /// Start an asynchronous decryption; the token is echoed back to the
  /// decryption callback. Returns false when the request was not accepted.
  std::function<bool(const std::vector<veil::schema::ciphertext_t>&,
                     const veil::schema::request_token_t&)>
      request_decryption;

  std::function<bool(const veil::schema::request_token_t&,
                     const cleartexts_t&,
                     const veil::schema::bytes_t&)>
      verify_decryption_proof;

  std::function<bool()> available;

  bool complete() const {
    return encrypt_zero && encrypt_uint64 && homomorphic_add &&
           request_decryption && verify_decryption_proof && available;
  }
};

}  // namespace veil::oracle
