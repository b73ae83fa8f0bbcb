#include <spdlog/spdlog.h>
#include <veil/ledger/attestation_log.hpp>
#include <veil/schema/key/ledger_keys.hpp>

#include <iterator>
#include <mutex>
#include <utility>

using namespace veil::schema;

namespace veil::ledger {

attestation_log::attestation_log(
    veil::schema::encoding::scale_encoder_t& encoder,
    veil::storage::rocksdb_storage_t& storage,
    const submission_store& submissions)
    : encoder_{encoder}, storage_{storage}, submissions_{submissions} {
  load_persisted_state();
}

operation_result<attestation_record_t> attestation_log::append(
    const submission_id_t submission_id,
    const principal_id_t& participant,
    bytes_t confidential_proof,
    const timestamp_milliseconds_t recorded_at) {
  if (!submissions_.contains(submission_id)) {
    return make_failure<attestation_record_t>(
        ledger_error_code::not_found,
        fmt::format("submission {} not found", submission_id));
  }
  if (confidential_proof.empty()) {
    return make_failure<attestation_record_t>(
        ledger_error_code::invalid_argument, "attestation proof is empty");
  }

  auto& stripe = records_.stripe_for(submission_id);
  auto lock = std::scoped_lock{stripe.mutex};
  auto& records = stripe.entries[submission_id];
  auto record = attestation_record_t{
      .version = 1,
      .submission_id = submission_id,
      .sequence = records.size(),
      .participant = participant,
      .confidential_proof = std::move(confidential_proof),
      .recorded_at = recorded_at};
  storage_.put(encoder_,
               key::make_attestation_key(submission_id, record.sequence),
               record);
  records.push_back(record);
  spdlog::info("Recorded attestation {} for submission {}", record.sequence,
               submission_id);
  return make_success(std::move(record));
}

std::vector<attestation_record_t> attestation_log::list(
    const submission_id_t submission_id) const {
  const auto& stripe = records_.stripe_for(submission_id);
  auto lock = std::scoped_lock{stripe.mutex};
  auto it = stripe.entries.find(submission_id);
  if (it == std::end(stripe.entries)) {
    return {};
  }
  return it->second;
}

void attestation_log::load_persisted_state() {
  spdlog::debug("Loading attestation log");
  // Big-endian keys: records arrive grouped by submission, in sequence order.
  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes(key::kAttestationKeyPrefix))) {
    auto record = encoder_.decode<attestation_record_t>(value);
    auto& stripe = records_.stripe_for(record.submission_id);
    auto lock = std::scoped_lock{stripe.mutex};
    stripe.entries[record.submission_id].push_back(std::move(record));
  }
}

}  // namespace veil::ledger
