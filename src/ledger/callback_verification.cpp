#include <spdlog/spdlog.h>
#include <veil/ledger/callback_verification.hpp>
#include <veil/schema/request_target.hpp>

using namespace veil::schema;

namespace veil::ledger {

operation_result<void> verify_callback(
    const veil::oracle::encryption_engine& engine,
    const decryption_request_t& request,
    const request_kind_t expected_kind,
    const std::size_t expected_values,
    const veil::oracle::cleartexts_t& cleartexts,
    const bytes_t& proof) {
  if (!engine.verify_decryption_proof(request.token, cleartexts, proof)) {
    spdlog::error("Decryption proof rejected for {} ({}); request stays "
                  "pending",
                  describe(request.target), to_hex(request.token));
    return make_failure<void>(ledger_error_code::proof_verification_failed,
                              "decryption proof did not verify");
  }
  if (request.kind != expected_kind) {
    return make_failure<void>(
        ledger_error_code::invalid_argument,
        fmt::format("token belongs to a {} request", to_string(request.kind)));
  }
  if (cleartexts.size() != expected_values) {
    spdlog::warn("Malformed callback for {}: {} cleartext(s), expected {}",
                 describe(request.target), cleartexts.size(),
                 expected_values);
    return make_failure<void>(
        ledger_error_code::invalid_argument,
        fmt::format("expected {} cleartext(s), got {}", expected_values,
                    cleartexts.size()));
  }
  return make_success();
}

}  // namespace veil::ledger
