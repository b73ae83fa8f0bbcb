#pragma once

#include <veil/common/sharded_map.hpp>
#include <veil/schema/decryption_request.hpp>
#include <veil/schema/encoding/scale/encoder.hpp>
#include <veil/schema/operation_result.hpp>
#include <veil/schema/primitives.hpp>
#include <veil/schema/request_kind.hpp>
#include <veil/schema/request_target.hpp>
#include <veil/storage/rocksdb/storage.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace veil::ledger {

/// Starts the oracle request for a freshly minted token; false when the
/// oracle did not accept it.
using dispatch_t = std::function<bool(const veil::schema::request_token_t&)>;

/// Checks a callback against the request it claims to answer. Runs while the
/// request's slot is held; a failure leaves the request outstanding.
using authenticator_t = std::function<veil::schema::operation_result<void>(
    const veil::schema::decryption_request_t&)>;

/// Applies an authenticated callback. Runs while the request's slot is still
/// held, so no later request for the same slot can be issued until it
/// returns.
using committer_t =
    std::function<void(const veil::schema::decryption_request_t&)>;

/// Tracks in-flight decryption requests.
///
/// A slot is one `(kind, target)` pair and holds at most one outstanding
/// token. Slots and tokens live in separate lock-striped maps; a slot stripe
/// is always taken before a token stripe. Outstanding requests are persisted
/// so a restart keeps answering callbacks issued before it.
class request_correlator final {
 public:
  request_correlator(veil::schema::encoding::scale_encoder_t& encoder,
                     veil::storage::rocksdb_storage_t& storage);

  /// Reserve the slot, mint a token and hand it to `dispatch`.
  ///
  /// `already_pending` when the slot is taken, `invalid_argument` when `kind`
  /// does not match the target's shape, `oracle_unavailable` (reservation
  /// rolled back) when `dispatch` refuses.
  veil::schema::operation_result<veil::schema::request_token_t> issue(
      const veil::schema::request_target_t& target,
      veil::schema::request_kind_t kind,
      veil::schema::timestamp_milliseconds_t issued_at,
      const dispatch_t& dispatch);

  /// Consume `token` once `authenticate` accepts it. `commit`, when set,
  /// runs after authentication and before the slot is released.
  ///
  /// Unknown and already consumed tokens both yield `unknown_request`.
  veil::schema::operation_result<veil::schema::decryption_request_t> resolve(
      const veil::schema::request_token_t& token,
      const authenticator_t& authenticate,
      const committer_t& commit = {});

  std::optional<veil::schema::decryption_request_t> find(
      const veil::schema::request_token_t& token) const;

  bool is_pending(const veil::schema::request_target_t& target,
                  veil::schema::request_kind_t kind) const;

  /// Administrative override: drop the outstanding request for a slot whose
  /// callback will never arrive. A late callback for the dropped token is
  /// then rejected as unknown.
  veil::schema::operation_result<veil::schema::decryption_request_t>
  force_clear(const veil::schema::request_target_t& target,
              veil::schema::request_kind_t kind);

  /// Outstanding requests, oldest first.
  std::vector<veil::schema::decryption_request_t> outstanding() const;

 private:
  static std::string make_slot_key(const veil::schema::request_target_t& target,
                                   veil::schema::request_kind_t kind);
  static veil::schema::request_token_t mint_token(const std::string& slot_key);

  /// Remove a request from both maps and storage; the slot stripe is held.
  void release(const std::string& slot_key,
               const veil::schema::request_token_t& token);
  void load_persisted_state();

  veil::schema::encoding::scale_encoder_t& encoder_;
  veil::storage::rocksdb_storage_t& storage_;
  veil::common::sharded_map<std::string, veil::schema::request_token_t> slots_;
  veil::common::sharded_map<veil::schema::request_token_t,
                            veil::schema::decryption_request_t,
                            veil::schema::hash32_hasher>
      requests_;
};

}  // namespace veil::ledger
