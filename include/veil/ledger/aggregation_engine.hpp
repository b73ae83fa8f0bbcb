#pragma once

#include <veil/common/sharded_map.hpp>
#include <veil/ledger/request_correlator.hpp>
#include <veil/oracle/encryption_engine.hpp>
#include <veil/schema/aggregation_mode.hpp>
#include <veil/schema/category_bucket.hpp>
#include <veil/schema/ciphertext.hpp>
#include <veil/schema/encoding/scale/encoder.hpp>
#include <veil/schema/operation_result.hpp>
#include <veil/schema/primitives.hpp>
#include <veil/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace veil::ledger {

/// Encrypted per-category running totals.
///
/// A global index of folded submission ids guarantees each submission is
/// counted once across all buckets. A fold holds the submission's index
/// stripe and then the bucket's stripe for the whole homomorphic add and
/// bucket update, and persists both in one write batch. A bucket reveal
/// records its count while the request's slot is still held, taking the slot
/// stripe before the bucket stripe, so reveals land in the order issued.
class aggregation_engine final {
 public:
  aggregation_engine(veil::schema::encoding::scale_encoder_t& encoder,
                     veil::storage::rocksdb_storage_t& storage,
                     const veil::oracle::encryption_engine& engine,
                     request_correlator& correlator,
                     veil::schema::aggregation_mode_t mode);

  /// Add one submission's contribution to its category bucket.
  ///
  /// `already_folded` (and no change) when the id was folded before;
  /// `type_mismatch` when sum mode is given a non-euint64 payload.
  veil::schema::operation_result<void> fold_submission(
      veil::schema::submission_id_t submission_id,
      const std::string& category,
      const veil::schema::ciphertext_t& encrypted_payload);

  /// Ask the oracle to decrypt the bucket's current encrypted count.
  veil::schema::operation_result<veil::schema::request_token_t>
  request_bucket_reveal(const std::string& category,
                        veil::schema::timestamp_milliseconds_t now);

  /// Authenticate and apply a bucket-count callback. The encrypted count is
  /// left as it is; the plaintext becomes the bucket's last revealed count.
  veil::schema::operation_result<veil::schema::bucket_count>
  apply_bucket_reveal(const veil::schema::request_token_t& token,
                      const veil::oracle::cleartexts_t& cleartexts,
                      const veil::schema::bytes_t& proof,
                      veil::schema::timestamp_milliseconds_t now);

  /// Last revealed count; an empty value when the bucket was never revealed.
  veil::schema::operation_result<std::optional<uint64_t>> revealed_count(
      const std::string& category) const;

  std::optional<veil::schema::category_bucket_t> bucket(
      const std::string& category) const;

  /// Every category with a bucket, sorted.
  std::vector<std::string> categories() const;

  /// Ids folded into the category's bucket, in fold order.
  std::vector<veil::schema::submission_id_t> folded_ids(
      const std::string& category) const;

  bool folded(veil::schema::submission_id_t submission_id) const;

  veil::schema::aggregation_mode_t mode() const;

 private:
  /// Store a revealed plaintext count; called with the reveal's slot held.
  void record_reveal(const std::string& category,
                     uint64_t count,
                     veil::schema::timestamp_milliseconds_t now);
  void load_persisted_state();

  veil::schema::encoding::scale_encoder_t& encoder_;
  veil::storage::rocksdb_storage_t& storage_;
  const veil::oracle::encryption_engine& engine_;
  request_correlator& correlator_;
  veil::schema::aggregation_mode_t mode_;
  veil::common::sharded_map<veil::schema::submission_id_t, std::string>
      folded_;
  veil::common::sharded_map<std::string, veil::schema::category_bucket_t>
      buckets_;
};

}  // namespace veil::ledger
