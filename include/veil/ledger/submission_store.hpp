#pragma once

#include <veil/common/sharded_map.hpp>
#include <veil/schema/ciphertext.hpp>
#include <veil/schema/encoding/scale/encoder.hpp>
#include <veil/schema/ledger_statistics.hpp>
#include <veil/schema/operation_result.hpp>
#include <veil/schema/primitives.hpp>
#include <veil/schema/submission_state.hpp>
#include <veil/schema/submission_status.hpp>
#include <veil/storage/rocksdb/storage.hpp>

#include <mutex>
#include <string>
#include <vector>

namespace veil::ledger {

/// Owner of every submission record.
///
/// Ids come from a single persisted sequence; everything else is guarded per
/// submission, so reveals and reviews of different submissions never contend.
/// Every mutation is written through to storage before it becomes visible.
class submission_store final {
 public:
  submission_store(veil::schema::encoding::scale_encoder_t& encoder,
                   veil::storage::rocksdb_storage_t& storage);

  /// Persist a new submission and return its id (ids start at 1).
  veil::schema::operation_result<veil::schema::submission_id_t> create(
      veil::schema::ciphertext_t encrypted_payload,
      veil::schema::ciphertext_t encrypted_category,
      const veil::schema::principal_id_t& owner,
      veil::schema::timestamp_milliseconds_t created_at,
      std::string description);

  veil::schema::operation_result<veil::schema::submission_state_t> get(
      veil::schema::submission_id_t submission_id) const;

  bool contains(veil::schema::submission_id_t submission_id) const;

  /// Record the plaintext of a submission exactly once.
  ///
  /// A second reveal returns `already_revealed` and leaves the stored
  /// plaintext untouched. Returns the updated record on success.
  veil::schema::operation_result<veil::schema::submission_state_t>
  apply_reveal(veil::schema::submission_id_t submission_id,
               veil::schema::bytes_t payload,
               std::string category);

  /// Owner-only transition out of `pending` to `verified` or `rejected`.
  veil::schema::operation_result<veil::schema::submission_state_t> review(
      veil::schema::submission_id_t submission_id,
      const veil::schema::principal_id_t& caller,
      veil::schema::submission_status_t verdict);

  /// All submissions, newest first.
  std::vector<veil::schema::submission_state_t> list() const;

  veil::schema::ledger_statistics statistics() const;

 private:
  void persist(const veil::schema::submission_state_t& state) const;
  void load_persisted_state();

  veil::schema::encoding::scale_encoder_t& encoder_;
  veil::storage::rocksdb_storage_t& storage_;
  std::mutex sequence_mutex_;
  veil::schema::submission_id_t next_id_{1};
  veil::common::sharded_map<veil::schema::submission_id_t,
                            veil::schema::submission_state_t>
      submissions_;
};

}  // namespace veil::ledger
