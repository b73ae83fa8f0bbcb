#pragma once

#include <veil/ledger/aggregation_engine.hpp>
#include <veil/ledger/attestation_log.hpp>
#include <veil/ledger/request_correlator.hpp>
#include <veil/ledger/submission_store.hpp>
#include <veil/oracle/encryption_engine.hpp>
#include <veil/schema/aggregation_mode.hpp>
#include <veil/schema/attestation_record.hpp>
#include <veil/schema/ciphertext.hpp>
#include <veil/schema/decryption_outcome.hpp>
#include <veil/schema/decryption_request.hpp>
#include <veil/schema/encoding/scale/encoder.hpp>
#include <veil/schema/ledger_statistics.hpp>
#include <veil/schema/operation_result.hpp>
#include <veil/schema/primitives.hpp>
#include <veil/schema/request_kind.hpp>
#include <veil/schema/request_target.hpp>
#include <veil/schema/submission_state.hpp>
#include <veil/schema/submission_status.hpp>
#include <veil/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace veil::ledger {

using clock_fn_t = std::function<veil::schema::timestamp_milliseconds_t()>;

/// Wall-clock milliseconds since the Unix epoch.
veil::schema::timestamp_milliseconds_t system_clock_now();

/// Exposed surface of the confidential ledger.
///
/// Wires the submission store, request correlator, aggregation engine and
/// attestation log to one encryption engine. Every operation is safe to call
/// from any thread, including `on_decryption_result`, which the oracle may
/// invoke concurrently and out of order.
class confidential_ledger final {
 public:
  /// Restore persisted state from `storage`. `engine` must have every
  /// callback set.
  confidential_ledger(veil::schema::encoding::scale_encoder_t& encoder,
                      veil::storage::rocksdb_storage_t& storage,
                      veil::oracle::encryption_engine engine,
                      veil::schema::aggregation_mode_t mode,
                      clock_fn_t clock = system_clock_now);

  confidential_ledger(const confidential_ledger&) = delete;
  confidential_ledger& operator=(const confidential_ledger&) = delete;

  /// Store a new encrypted submission owned by `owner`.
  ///
  /// In sum mode the payload must be an euint64 handle (`type_mismatch`).
  veil::schema::operation_result<veil::schema::submission_id_t> submit(
      veil::schema::ciphertext_t encrypted_payload,
      veil::schema::ciphertext_t encrypted_category,
      const veil::schema::principal_id_t& owner,
      std::string description);

  /// Owner-only. Starts decryption of the submission's payload and category;
  /// the result arrives later through `on_decryption_result`.
  veil::schema::operation_result<veil::schema::request_token_t>
  request_submission_reveal(veil::schema::submission_id_t submission_id,
                            const veil::schema::principal_id_t& caller);

  /// Oracle callback entry point.
  ///
  /// Routes by the kind the token was issued for. A submission reveal stores
  /// the plaintext and folds the submission into its category bucket, with a
  /// failed fold reported in `fold_code`; a bucket reveal records the
  /// plaintext count. A callback that fails proof
  /// verification or is malformed changes nothing and leaves the request
  /// outstanding.
  veil::schema::operation_result<veil::schema::decryption_outcome>
  on_decryption_result(const veil::schema::request_token_t& token,
                       const veil::oracle::cleartexts_t& cleartexts,
                       const veil::schema::bytes_t& proof);

  veil::schema::operation_result<veil::schema::submission_state_t>
  get_submission(veil::schema::submission_id_t submission_id) const;

  /// Newest first.
  veil::schema::operation_result<std::vector<veil::schema::submission_state_t>>
  list_submissions() const;

  veil::schema::operation_result<veil::schema::submission_state_t>
  review_submission(veil::schema::submission_id_t submission_id,
                    const veil::schema::principal_id_t& caller,
                    veil::schema::submission_status_t verdict);

  veil::schema::operation_result<veil::schema::ledger_statistics> statistics()
      const;

  veil::schema::operation_result<veil::schema::request_token_t>
  request_bucket_reveal(const std::string& category);

  /// Last revealed count for the category; empty until a bucket reveal has
  /// completed. `not_found` when nothing was ever folded into it.
  veil::schema::operation_result<std::optional<uint64_t>> get_bucket_count(
      const std::string& category) const;

  std::vector<std::string> categories() const;

  veil::schema::operation_result<veil::schema::attestation_record_t>
  record_attestation(veil::schema::submission_id_t submission_id,
                     const veil::schema::principal_id_t& participant,
                     veil::schema::bytes_t confidential_proof);

  veil::schema::operation_result<
      std::vector<veil::schema::attestation_record_t>>
  list_attestations(veil::schema::submission_id_t submission_id) const;

  /// Administrative override for a request whose callback is lost.
  veil::schema::operation_result<veil::schema::decryption_request_t>
  force_clear_request(const veil::schema::request_target_t& target,
                      veil::schema::request_kind_t kind);

  std::vector<veil::schema::decryption_request_t> outstanding_requests() const;

  bool is_available() const;

  veil::schema::aggregation_mode_t mode() const;

 private:
  veil::schema::operation_result<veil::schema::decryption_outcome>
  apply_submission_reveal(const veil::schema::request_token_t& token,
                          const veil::oracle::cleartexts_t& cleartexts,
                          const veil::schema::bytes_t& proof);

  /// Fold a revealed submission; a repeat fold counts as success.
  veil::schema::operation_result<void> fold_revealed(
      const veil::schema::submission_state_t& submission);

  /// Fold revealed submissions whose fold did not land before a restart.
  void reconcile_folds();

  veil::oracle::encryption_engine engine_;
  clock_fn_t clock_;
  submission_store submissions_;
  request_correlator correlator_;
  aggregation_engine aggregation_;
  attestation_log attestations_;
};

}  // namespace veil::ledger
