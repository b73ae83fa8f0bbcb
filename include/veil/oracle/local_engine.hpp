#pragma once

#include <veil/crypto/aead.hpp>
#include <veil/crypto/signing.hpp>
#include <veil/oracle/encryption_engine.hpp>
#include <veil/schema/ciphertext.hpp>
#include <veil/schema/primitives.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace veil::oracle {

struct engine_keys final {
  veil::crypto::aes256_key_t sealing_key{};
  veil::crypto::ed25519_private_key_t signing_key{};
};

std::optional<engine_keys> generate_engine_keys();

/// Key file layout: 32-byte sealing key followed by the 32-byte Ed25519 seed.
std::optional<engine_keys> load_engine_keys(std::string_view path);
bool save_engine_keys(std::string_view path, const engine_keys& keys);

/// Bytes signed by a decryption proof: SCALE(token, cleartexts).
veil::schema::bytes_t make_proof_message(
    const veil::schema::request_token_t& token,
    const cleartexts_t& cleartexts);

/// Single-node stand-in for the decryption oracle.
///
/// Envelopes are AES-256-GCM sealed values with the type tag bound as AAD, so
/// the add runs inside the engine on opened values and the ledger never sees
/// them. Decryption requests queue until one of the deliver calls runs them;
/// each delivery signs `make_proof_message(token, cleartexts)` with the
/// engine's Ed25519 key.
class local_engine final {
 public:
  explicit local_engine(const engine_keys& keys);

  local_engine(const local_engine&) = delete;
  local_engine& operator=(const local_engine&) = delete;

  /// Client-side encryption.
  veil::schema::ciphertext_t encrypt(uint64_t value) const;
  veil::schema::ciphertext_t encrypt(const veil::schema::bytes_view_t& value) const;
  veil::schema::ciphertext_t encrypt(std::string_view value) const;

  veil::schema::ciphertext_t encrypt_zero() const;
  std::optional<veil::schema::ciphertext_t> homomorphic_add(
      const veil::schema::ciphertext_t& lhs,
      const veil::schema::ciphertext_t& rhs) const;
  bool request_decryption(
      const std::vector<veil::schema::ciphertext_t>& ciphertexts,
      const veil::schema::request_token_t& token);
  bool verify_decryption_proof(const veil::schema::request_token_t& token,
                               const cleartexts_t& cleartexts,
                               const veil::schema::bytes_t& proof) const;
  bool available() const;

  const veil::crypto::ed25519_public_key_t& public_key() const;

  /// Install the handler completed requests are delivered to.
  void set_callback(decryption_callback_t callback);

  std::size_t queued() const;

  /// Complete the queued request for `token`; false when it is not queued or
  /// one of its envelopes does not open.
  bool deliver(const veil::schema::request_token_t& token);
  bool deliver_next();
  std::size_t deliver_all();

  /// Callback bundle bound to this instance. The engine must outlive it.
  encryption_engine bind();

 private:
  struct queued_request final {
    veil::schema::request_token_t token{};
    std::vector<veil::schema::ciphertext_t> ciphertexts;
  };

  bool complete(const queued_request& request);
  veil::schema::ciphertext_t seal_value(veil::schema::ciphertext_type_t type,
                                        const veil::schema::bytes_view_t& value) const;
  std::optional<veil::schema::bytes_t> open_value(
      const veil::schema::ciphertext_t& value) const;

  engine_keys keys_;
  veil::crypto::ed25519_public_key_t public_key_{};
  mutable std::mutex mutex_;
  std::deque<queued_request> queue_;
  decryption_callback_t callback_;
};

}  // namespace veil::oracle
