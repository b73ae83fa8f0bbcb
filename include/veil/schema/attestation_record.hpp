#pragma once
#include <veil/schema/primitives.hpp>

// Schema type: attestation record.
// Supply-chain participation proof. The proof blob is a hash or signature
// produced elsewhere; the ledger orders and keeps it but never interprets it.
namespace veil::schema {

template <uint16_t Version>
struct attestation_record;

template <>
struct attestation_record<1> final {
  uint16_t version{1};
  submission_id_t submission_id{};
  uint64_t sequence{};
  principal_id_t participant{};
  bytes_t confidential_proof;
  timestamp_milliseconds_t recorded_at{};
};

using attestation_record_t = attestation_record<1>;

}  // namespace veil::schema
