#pragma once

#include <veil/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema key type: ledger keys.
// Canonical key prefixes and key builders for every persisted ledger record.
// Numeric key parts are big-endian so prefix scans come back in numeric order.
namespace veil::schema::key {

inline constexpr std::string_view kSubmissionKeyPrefix{
    "SYS|STATE|SUBMISSION|"};
inline constexpr std::string_view kSubmissionSequenceKey{
    "SYS|STATE|SUBMISSION_SEQ|"};
inline constexpr std::string_view kRequestKeyPrefix{"SYS|STATE|REQUEST|"};
inline constexpr std::string_view kBucketKeyPrefix{"SYS|STATE|BUCKET|"};
inline constexpr std::string_view kFoldedKeyPrefix{"SYS|STATE|FOLDED|"};
inline constexpr std::string_view kBucketMemberKeyPrefix{"SYS|STATE|MEMBER|"};
inline constexpr std::string_view kAttestationKeyPrefix{"SYS|STATE|ATTEST|"};

inline const std::array<std::string_view, 7> kLedgerKeyspaces{
    kSubmissionKeyPrefix,   kSubmissionSequenceKey, kRequestKeyPrefix,
    kBucketKeyPrefix,       kFoldedKeyPrefix,       kBucketMemberKeyPrefix,
    kAttestationKeyPrefix};

bytes_t make_prefixed_key(std::string_view prefix, const bytes_view_t& id);

bytes_t make_submission_key(submission_id_t submission_id);
bytes_t make_submission_sequence_key();
bytes_t make_request_key(const request_token_t& token);
// Categories are free text; the key holds their BLAKE3 digest.
bytes_t make_bucket_key(std::string_view category);
bytes_t make_folded_key(submission_id_t submission_id);
// Fold order within a bucket: category digest, then the big-endian position.
bytes_t make_bucket_member_prefix(std::string_view category);
bytes_t make_bucket_member_key(std::string_view category, uint64_t position);
bytes_t make_attestation_prefix(submission_id_t submission_id);
bytes_t make_attestation_key(submission_id_t submission_id, uint64_t sequence);

}  // namespace veil::schema::key
