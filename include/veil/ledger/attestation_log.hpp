#pragma once

#include <veil/common/sharded_map.hpp>
#include <veil/ledger/submission_store.hpp>
#include <veil/schema/attestation_record.hpp>
#include <veil/schema/encoding/scale/encoder.hpp>
#include <veil/schema/operation_result.hpp>
#include <veil/schema/primitives.hpp>
#include <veil/storage/rocksdb/storage.hpp>

#include <vector>

namespace veil::ledger {

/// Append-only supply-chain attestations, sequenced per submission from 0.
class attestation_log final {
 public:
  attestation_log(veil::schema::encoding::scale_encoder_t& encoder,
                  veil::storage::rocksdb_storage_t& storage,
                  const submission_store& submissions);

  veil::schema::operation_result<veil::schema::attestation_record_t> append(
      veil::schema::submission_id_t submission_id,
      const veil::schema::principal_id_t& participant,
      veil::schema::bytes_t confidential_proof,
      veil::schema::timestamp_milliseconds_t recorded_at);

  /// Records in append order; empty when none were appended.
  std::vector<veil::schema::attestation_record_t> list(
      veil::schema::submission_id_t submission_id) const;

 private:
  void load_persisted_state();

  veil::schema::encoding::scale_encoder_t& encoder_;
  veil::storage::rocksdb_storage_t& storage_;
  const submission_store& submissions_;
  veil::common::sharded_map<veil::schema::submission_id_t,
                            std::vector<veil::schema::attestation_record_t>>
      records_;
};

}  // namespace veil::ledger
