#include <spdlog/spdlog.h>
#include <veil/common/critical.hpp>
#include <veil/ledger/aggregation_engine.hpp>
#include <veil/ledger/callback_verification.hpp>
#include <veil/schema/key/ledger_keys.hpp>

#include <algorithm>
#include <iterator>
#include <mutex>
#include <utility>

using namespace veil::schema;

namespace veil::ledger {

aggregation_engine::aggregation_engine(
    veil::schema::encoding::scale_encoder_t& encoder,
    veil::storage::rocksdb_storage_t& storage,
    const veil::oracle::encryption_engine& engine,
    request_correlator& correlator,
    const aggregation_mode_t mode)
    : encoder_{encoder},
      storage_{storage},
      engine_{engine},
      correlator_{correlator},
      mode_{mode} {
  load_persisted_state();
  spdlog::info("Aggregation engine ready in {} mode with {} bucket(s)",
               to_string(mode_), buckets_.size());
}

operation_result<void> aggregation_engine::fold_submission(
    const submission_id_t submission_id,
    const std::string& category,
    const ciphertext_t& encrypted_payload) {
  if (mode_ == aggregation_mode_t::sum &&
      encrypted_payload.type != ciphertext_type_t::euint64) {
    return make_failure<void>(
        ledger_error_code::type_mismatch,
        fmt::format("sum mode needs an euint64 payload, submission {} has {}",
                    submission_id, to_string(encrypted_payload.type)));
  }

  auto& index_stripe = folded_.stripe_for(submission_id);
  auto index_lock = std::scoped_lock{index_stripe.mutex};
  if (index_stripe.entries.contains(submission_id)) {
    return make_failure<void>(
        ledger_error_code::already_folded,
        fmt::format("submission {} already folded", submission_id));
  }

  auto& bucket_stripe = buckets_.stripe_for(category);
  auto bucket_lock = std::scoped_lock{bucket_stripe.mutex};
  auto existing = bucket_stripe.entries.find(category);
  auto bucket = existing != std::end(bucket_stripe.entries)
                    ? existing->second
                    : category_bucket_t{.version = 1,
                                        .category = category,
                                        .encrypted_count =
                                            engine_.encrypt_zero()};

  auto contribution = mode_ == aggregation_mode_t::count
                          ? engine_.encrypt_uint64(1)
                          : encrypted_payload;
  auto total = engine_.homomorphic_add(bucket.encrypted_count, contribution);
  if (!total) {
    return make_failure<void>(
        ledger_error_code::invalid_argument,
        fmt::format("encryption engine rejected the add for submission {}",
                    submission_id));
  }
  bucket.encrypted_count = std::move(*total);
  auto position = bucket.folded_count++;

  auto batch = veil::storage::write_batch{};
  batch.puts.emplace_back(key::make_bucket_key(category),
                          encoder_.encode(bucket));
  batch.puts.emplace_back(key::make_bucket_member_key(category, position),
                          encoder_.encode(submission_id));
  batch.puts.emplace_back(key::make_folded_key(submission_id),
                          encoder_.encode(category));
  storage_.write(batch);

  bucket_stripe.entries.insert_or_assign(category, std::move(bucket));
  index_stripe.entries.emplace(submission_id, category);
  spdlog::info("Folded submission {} into bucket '{}'", submission_id,
               category);
  return make_success();
}

operation_result<request_token_t> aggregation_engine::request_bucket_reveal(
    const std::string& category,
    const timestamp_milliseconds_t now) {
  auto current = bucket(category);
  if (!current) {
    return make_failure<request_token_t>(
        ledger_error_code::not_found,
        fmt::format("no bucket for category '{}'", category));
  }
  auto encrypted_count = current->encrypted_count;
  return correlator_.issue(
      bucket_ref{.category = category}, request_kind_t::bucket_count_reveal,
      now, [&](const request_token_t& token) {
        return engine_.request_decryption({encrypted_count}, token);
      });
}

operation_result<bucket_count> aggregation_engine::apply_bucket_reveal(
    const request_token_t& token,
    const veil::oracle::cleartexts_t& cleartexts,
    const bytes_t& proof,
    const timestamp_milliseconds_t now) {
  auto count = uint64_t{};
  auto resolved = correlator_.resolve(
      token,
      [&](const decryption_request_t& request) -> operation_result<void> {
        auto verdict =
            verify_callback(engine_, request,
                            request_kind_t::bucket_count_reveal, 1,
                            cleartexts, proof);
        if (!verdict.ok()) {
          return verdict;
        }
        auto decoded = try_decode_uint64_le(cleartexts.front());
        if (!decoded) {
          return make_failure<void>(ledger_error_code::invalid_argument,
                                    "bucket count is not an 8-byte value");
        }
        count = *decoded;
        return make_success();
      },
      [&](const decryption_request_t& request) {
        // The slot is still held: a newer reveal for this bucket cannot be
        // issued, let alone applied, before this count is recorded.
        record_reveal(std::get<bucket_ref>(request.target).category, count,
                      now);
      });
  if (!resolved.ok()) {
    return forward_failure<bucket_count>(resolved);
  }

  const auto& category = std::get<bucket_ref>(resolved.value->target).category;
  spdlog::info("Bucket '{}' revealed count {}", category, count);
  return make_success(bucket_count{.category = category, .count = count});
}

void aggregation_engine::record_reveal(const std::string& category,
                                       const uint64_t count,
                                       const timestamp_milliseconds_t now) {
  auto& stripe = buckets_.stripe_for(category);
  auto lock = std::scoped_lock{stripe.mutex};
  auto it = stripe.entries.find(category);
  if (it == std::end(stripe.entries)) {
    veil::common::critical("bucket reveal resolved for a missing bucket");
  }
  auto updated = it->second;
  updated.last_revealed_count = count;
  updated.last_revealed_at = now;
  storage_.put(encoder_, key::make_bucket_key(category), updated);
  it->second = std::move(updated);
}

operation_result<std::optional<uint64_t>> aggregation_engine::revealed_count(
    const std::string& category) const {
  auto current = bucket(category);
  if (!current) {
    return make_failure<std::optional<uint64_t>>(
        ledger_error_code::not_found,
        fmt::format("no bucket for category '{}'", category));
  }
  return make_success(current->last_revealed_count);
}

std::optional<category_bucket_t> aggregation_engine::bucket(
    const std::string& category) const {
  const auto& stripe = buckets_.stripe_for(category);
  auto lock = std::scoped_lock{stripe.mutex};
  auto it = stripe.entries.find(category);
  if (it == std::end(stripe.entries)) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::string> aggregation_engine::categories() const {
  auto out = std::vector<std::string>{};
  buckets_.for_each([&](const std::string& category, const category_bucket_t&) {
    out.push_back(category);
  });
  std::sort(std::begin(out), std::end(out));
  return out;
}

std::vector<submission_id_t> aggregation_engine::folded_ids(
    const std::string& category) const {
  auto out = std::vector<submission_id_t>{};
  for (const auto& [key, value] :
       storage_.list_by_prefix(key::make_bucket_member_prefix(category))) {
    out.push_back(encoder_.decode<submission_id_t>(value));
  }
  return out;
}

bool aggregation_engine::folded(const submission_id_t submission_id) const {
  const auto& stripe = folded_.stripe_for(submission_id);
  auto lock = std::scoped_lock{stripe.mutex};
  return stripe.entries.contains(submission_id);
}

aggregation_mode_t aggregation_engine::mode() const {
  return mode_;
}

void aggregation_engine::load_persisted_state() {
  spdlog::debug("Loading category buckets");
  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes(key::kBucketKeyPrefix))) {
    auto bucket = encoder_.decode<category_bucket_t>(value);
    auto& stripe = buckets_.stripe_for(bucket.category);
    auto lock = std::scoped_lock{stripe.mutex};
    stripe.entries.insert_or_assign(bucket.category, std::move(bucket));
  }

  auto prefix_size = key::kFoldedKeyPrefix.size();
  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes(key::kFoldedKeyPrefix))) {
    auto submission_id =
        try_decode_uint64_be(bytes_view_t{key}.subspan(prefix_size));
    if (!submission_id) {
      veil::common::critical("malformed folded-index key");
    }
    auto& stripe = folded_.stripe_for(*submission_id);
    auto lock = std::scoped_lock{stripe.mutex};
    stripe.entries.insert_or_assign(*submission_id,
                                    encoder_.decode<std::string>(value));
  }
}

}  // namespace veil::ledger
