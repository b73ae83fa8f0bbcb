#pragma once

#include <veil/oracle/encryption_engine.hpp>
#include <veil/schema/decryption_request.hpp>
#include <veil/schema/operation_result.hpp>
#include <veil/schema/primitives.hpp>
#include <veil/schema/request_kind.hpp>

#include <cstddef>

namespace veil::ledger {

/// Accept a decryption callback only if the oracle's proof covers exactly
/// these cleartexts for this token, the request is of `expected_kind`, and
/// it carries `expected_values` cleartexts.
///
/// `proof_verification_failed` for a bad proof, `invalid_argument` for a
/// callback of the wrong shape.
veil::schema::operation_result<void> verify_callback(
    const veil::oracle::encryption_engine& engine,
    const veil::schema::decryption_request_t& request,
    veil::schema::request_kind_t expected_kind,
    std::size_t expected_values,
    const veil::oracle::cleartexts_t& cleartexts,
    const veil::schema::bytes_t& proof);

}  // namespace veil::ledger
