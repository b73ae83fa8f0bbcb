#include <spdlog/spdlog.h>
#include <veil/common/critical.hpp>
#include <veil/ledger/callback_verification.hpp>
#include <veil/ledger/confidential_ledger.hpp>

#include <chrono>
#include <utility>

using namespace veil::schema;

namespace veil::ledger {

timestamp_milliseconds_t system_clock_now() {
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

confidential_ledger::confidential_ledger(
    veil::schema::encoding::scale_encoder_t& encoder,
    veil::storage::rocksdb_storage_t& storage,
    veil::oracle::encryption_engine engine,
    const aggregation_mode_t mode,
    clock_fn_t clock)
    : engine_{std::move(engine)},
      clock_{std::move(clock)},
      submissions_{encoder, storage},
      correlator_{encoder, storage},
      aggregation_{encoder, storage, engine_, correlator_, mode},
      attestations_{encoder, storage, submissions_} {
  if (!engine_.complete()) {
    veil::common::critical("encryption engine is missing callbacks");
  }
  if (!clock_) {
    veil::common::critical("confidential ledger needs a clock");
  }
  reconcile_folds();
  spdlog::info("Confidential ledger ready: {} submission(s), {} outstanding "
               "request(s)",
               submissions_.statistics().total,
               correlator_.outstanding().size());
}

operation_result<submission_id_t> confidential_ledger::submit(
    ciphertext_t encrypted_payload,
    ciphertext_t encrypted_category,
    const principal_id_t& owner,
    std::string description) {
  if (aggregation_.mode() == aggregation_mode_t::sum &&
      encrypted_payload.type != ciphertext_type_t::euint64) {
    return make_failure<submission_id_t>(
        ledger_error_code::type_mismatch,
        "sum aggregation needs an euint64 payload");
  }
  return submissions_.create(std::move(encrypted_payload),
                             std::move(encrypted_category), owner, clock_(),
                             std::move(description));
}

operation_result<request_token_t> confidential_ledger::request_submission_reveal(
    const submission_id_t submission_id,
    const principal_id_t& caller) {
  auto submission = submissions_.get(submission_id);
  if (!submission.ok()) {
    return forward_failure<request_token_t>(submission);
  }
  if (submission.value->owner != caller) {
    return make_failure<request_token_t>(
        ledger_error_code::unauthorized,
        fmt::format("only the owner may reveal submission {}",
                    submission_id));
  }
  if (submission.value->revealed) {
    return make_failure<request_token_t>(
        ledger_error_code::already_revealed,
        fmt::format("submission {} already revealed", submission_id));
  }
  if (!engine_.available()) {
    return make_failure<request_token_t>(
        ledger_error_code::oracle_unavailable,
        "decryption oracle is not available");
  }

  auto ciphertexts = std::vector<ciphertext_t>{
      submission.value->encrypted_payload,
      submission.value->encrypted_category};
  return correlator_.issue(
      submission_ref{.submission_id = submission_id},
      request_kind_t::submission_reveal, clock_(),
      [&](const request_token_t& token) {
        return engine_.request_decryption(ciphertexts, token);
      });
}

operation_result<decryption_outcome> confidential_ledger::on_decryption_result(
    const request_token_t& token,
    const veil::oracle::cleartexts_t& cleartexts,
    const bytes_t& proof) {
  auto request = correlator_.find(token);
  if (!request) {
    spdlog::warn("Rejected callback for unknown request {}", to_hex(token));
    return make_failure<decryption_outcome>(ledger_error_code::unknown_request,
                                            "unknown request token");
  }

  switch (request->kind) {
    case request_kind_t::submission_reveal:
      return apply_submission_reveal(token, cleartexts, proof);
    case request_kind_t::bucket_count_reveal: {
      auto revealed =
          aggregation_.apply_bucket_reveal(token, cleartexts, proof, clock_());
      if (!revealed.ok()) {
        return forward_failure<decryption_outcome>(revealed);
      }
      return make_success(decryption_outcome{
          .kind = request_kind_t::bucket_count_reveal,
          .target = bucket_ref{.category = revealed.value->category},
          .revealed_count = std::move(*revealed.value)});
    }
  }
  return make_failure<decryption_outcome>(ledger_error_code::invalid_state,
                                          "unsupported request kind");
}

operation_result<decryption_outcome> confidential_ledger::apply_submission_reveal(
    const request_token_t& token,
    const veil::oracle::cleartexts_t& cleartexts,
    const bytes_t& proof) {
  auto resolved = correlator_.resolve(
      token, [&](const decryption_request_t& request) {
        return verify_callback(engine_, request,
                               request_kind_t::submission_reveal, 2,
                               cleartexts, proof);
      });
  if (!resolved.ok()) {
    return forward_failure<decryption_outcome>(resolved);
  }

  auto submission_id =
      std::get<submission_ref>(resolved.value->target).submission_id;
  auto revealed = submissions_.apply_reveal(submission_id, cleartexts[0],
                                            make_string(cleartexts[1]));
  if (!revealed.ok()) {
    return forward_failure<decryption_outcome>(revealed);
  }
  auto folded = fold_revealed(*revealed.value);

  return make_success(decryption_outcome{
      .kind = request_kind_t::submission_reveal,
      .target = submission_ref{.submission_id = submission_id},
      .revealed_count = std::nullopt,
      .fold_code = folded.code,
      .fold_log = std::move(folded.log)});
}

operation_result<void> confidential_ledger::fold_revealed(
    const submission_state_t& submission) {
  auto folded = aggregation_.fold_submission(submission.submission_id,
                                             *submission.revealed_category,
                                             submission.encrypted_payload);
  if (folded.code == ledger_error_code::already_folded) {
    spdlog::debug("Submission {} was already folded",
                  submission.submission_id);
    return make_success();
  }
  if (!folded.ok()) {
    spdlog::warn("Submission {} revealed but not aggregated: {}",
                 submission.submission_id, folded.log);
  }
  return folded;
}

void confidential_ledger::reconcile_folds() {
  for (const auto& submission : submissions_.list()) {
    if (submission.revealed && !aggregation_.folded(submission.submission_id)) {
      spdlog::info("Folding submission {} revealed before restart",
                   submission.submission_id);
      fold_revealed(submission);
    }
  }
}

operation_result<submission_state_t> confidential_ledger::get_submission(
    const submission_id_t submission_id) const {
  return submissions_.get(submission_id);
}

operation_result<std::vector<submission_state_t>>
confidential_ledger::list_submissions() const {
  return make_success(submissions_.list());
}

operation_result<submission_state_t> confidential_ledger::review_submission(
    const submission_id_t submission_id,
    const principal_id_t& caller,
    const submission_status_t verdict) {
  return submissions_.review(submission_id, caller, verdict);
}

operation_result<ledger_statistics> confidential_ledger::statistics() const {
  return make_success(submissions_.statistics());
}

operation_result<request_token_t> confidential_ledger::request_bucket_reveal(
    const std::string& category) {
  if (!engine_.available()) {
    return make_failure<request_token_t>(
        ledger_error_code::oracle_unavailable,
        "decryption oracle is not available");
  }
  return aggregation_.request_bucket_reveal(category, clock_());
}

operation_result<std::optional<uint64_t>> confidential_ledger::get_bucket_count(
    const std::string& category) const {
  return aggregation_.revealed_count(category);
}

std::vector<std::string> confidential_ledger::categories() const {
  return aggregation_.categories();
}

operation_result<attestation_record_t> confidential_ledger::record_attestation(
    const submission_id_t submission_id,
    const principal_id_t& participant,
    bytes_t confidential_proof) {
  return attestations_.append(submission_id, participant,
                              std::move(confidential_proof), clock_());
}

operation_result<std::vector<attestation_record_t>>
confidential_ledger::list_attestations(
    const submission_id_t submission_id) const {
  return make_success(attestations_.list(submission_id));
}

operation_result<decryption_request_t> confidential_ledger::force_clear_request(
    const request_target_t& target,
    const request_kind_t kind) {
  return correlator_.force_clear(target, kind);
}

std::vector<decryption_request_t> confidential_ledger::outstanding_requests()
    const {
  return correlator_.outstanding();
}

bool confidential_ledger::is_available() const {
  return engine_.available();
}

aggregation_mode_t confidential_ledger::mode() const {
  return aggregation_.mode();
}

}  // namespace veil::ledger
