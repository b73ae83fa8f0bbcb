#include <veil/blake3/hash.hpp>
#include <veil/schema/key/ledger_keys.hpp>

#include <iterator>

namespace veil::schema::key {

bytes_t make_prefixed_key(const std::string_view prefix,
                          const bytes_view_t& id) {
  auto key = make_bytes(prefix);
  key.reserve(key.size() + id.size());
  key.insert(std::end(key), std::begin(id), std::end(id));
  return key;
}

bytes_t make_submission_key(const submission_id_t submission_id) {
  return make_prefixed_key(kSubmissionKeyPrefix,
                           encode_uint64_be(submission_id));
}

bytes_t make_submission_sequence_key() {
  return make_bytes(kSubmissionSequenceKey);
}

bytes_t make_request_key(const request_token_t& token) {
  return make_prefixed_key(kRequestKeyPrefix, token);
}

bytes_t make_bucket_key(const std::string_view category) {
  return make_prefixed_key(kBucketKeyPrefix, veil::blake3::hash(category));
}

bytes_t make_folded_key(const submission_id_t submission_id) {
  return make_prefixed_key(kFoldedKeyPrefix, encode_uint64_be(submission_id));
}

bytes_t make_bucket_member_prefix(const std::string_view category) {
  return make_prefixed_key(kBucketMemberKeyPrefix,
                           veil::blake3::hash(category));
}

bytes_t make_bucket_member_key(const std::string_view category,
                               const uint64_t position) {
  auto key = make_bucket_member_prefix(category);
  auto suffix = encode_uint64_be(position);
  key.insert(std::end(key), std::begin(suffix), std::end(suffix));
  return key;
}

bytes_t make_attestation_prefix(const submission_id_t submission_id) {
  return make_prefixed_key(kAttestationKeyPrefix,
                           encode_uint64_be(submission_id));
}

bytes_t make_attestation_key(const submission_id_t submission_id,
                             const uint64_t sequence) {
  auto key = make_attestation_prefix(submission_id);
  auto suffix = encode_uint64_be(sequence);
  key.insert(std::end(key), std::begin(suffix), std::end(suffix));
  return key;
}

}  // namespace veil::schema::key
