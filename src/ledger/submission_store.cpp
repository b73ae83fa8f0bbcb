#include <spdlog/spdlog.h>
#include <veil/ledger/submission_store.hpp>
#include <veil/schema/key/ledger_keys.hpp>

#include <algorithm>
#include <iterator>
#include <mutex>
#include <utility>

using namespace veil::schema;

namespace veil::ledger {

submission_store::submission_store(
    veil::schema::encoding::scale_encoder_t& encoder,
    veil::storage::rocksdb_storage_t& storage)
    : encoder_{encoder}, storage_{storage} {
  load_persisted_state();
}

operation_result<submission_id_t> submission_store::create(
    ciphertext_t encrypted_payload,
    ciphertext_t encrypted_category,
    const principal_id_t& owner,
    const timestamp_milliseconds_t created_at,
    std::string description) {
  if (encrypted_payload.handle.empty()) {
    return make_failure<submission_id_t>(ledger_error_code::invalid_argument,
                                         "encrypted payload is empty");
  }
  if (encrypted_category.handle.empty()) {
    return make_failure<submission_id_t>(ledger_error_code::invalid_argument,
                                         "encrypted category is empty");
  }
  if (encrypted_category.type != ciphertext_type_t::ebytes) {
    return make_failure<submission_id_t>(ledger_error_code::type_mismatch,
                                         "category must be an ebytes handle");
  }

  auto lock = std::scoped_lock{sequence_mutex_};
  auto submission_id = next_id_;
  auto state = submission_state_t{.version = 1,
                                  .submission_id = submission_id,
                                  .encrypted_payload =
                                      std::move(encrypted_payload),
                                  .encrypted_category =
                                      std::move(encrypted_category),
                                  .owner = owner,
                                  .created_at = created_at,
                                  .description = std::move(description)};

  // The record and the advanced sequence land together, so a reopened store
  // can never hand out an id it already used.
  auto batch = veil::storage::write_batch{};
  batch.puts.emplace_back(key::make_submission_key(submission_id),
                          encoder_.encode(state));
  batch.puts.emplace_back(key::make_submission_sequence_key(),
                          encoder_.encode(submission_id + 1));
  storage_.write(batch);

  {
    auto& stripe = submissions_.stripe_for(submission_id);
    auto stripe_lock = std::scoped_lock{stripe.mutex};
    stripe.entries.insert_or_assign(submission_id, std::move(state));
  }
  next_id_ = submission_id + 1;
  spdlog::info("Created submission {}", submission_id);
  return make_success(submission_id);
}

operation_result<submission_state_t> submission_store::get(
    const submission_id_t submission_id) const {
  const auto& stripe = submissions_.stripe_for(submission_id);
  auto lock = std::scoped_lock{stripe.mutex};
  auto it = stripe.entries.find(submission_id);
  if (it == std::end(stripe.entries)) {
    return make_failure<submission_state_t>(
        ledger_error_code::not_found,
        fmt::format("submission {} not found", submission_id));
  }
  return make_success(it->second);
}

bool submission_store::contains(const submission_id_t submission_id) const {
  const auto& stripe = submissions_.stripe_for(submission_id);
  auto lock = std::scoped_lock{stripe.mutex};
  return stripe.entries.contains(submission_id);
}

operation_result<submission_state_t> submission_store::apply_reveal(
    const submission_id_t submission_id,
    bytes_t payload,
    std::string category) {
  auto& stripe = submissions_.stripe_for(submission_id);
  auto lock = std::scoped_lock{stripe.mutex};
  auto it = stripe.entries.find(submission_id);
  if (it == std::end(stripe.entries)) {
    return make_failure<submission_state_t>(
        ledger_error_code::not_found,
        fmt::format("submission {} not found", submission_id));
  }
  if (it->second.revealed) {
    spdlog::warn("Ignoring second reveal of submission {}", submission_id);
    return make_failure<submission_state_t>(
        ledger_error_code::already_revealed,
        fmt::format("submission {} already revealed", submission_id));
  }

  auto updated = it->second;
  updated.revealed = true;
  updated.revealed_payload = std::move(payload);
  updated.revealed_category = std::move(category);
  persist(updated);
  it->second = updated;
  spdlog::info("Revealed submission {} (category '{}')", submission_id,
               *updated.revealed_category);
  return make_success(std::move(updated));
}

operation_result<submission_state_t> submission_store::review(
    const submission_id_t submission_id,
    const principal_id_t& caller,
    const submission_status_t verdict) {
  if (verdict == submission_status_t::pending) {
    return make_failure<submission_state_t>(
        ledger_error_code::invalid_argument,
        "review verdict must be verified or rejected");
  }

  auto& stripe = submissions_.stripe_for(submission_id);
  auto lock = std::scoped_lock{stripe.mutex};
  auto it = stripe.entries.find(submission_id);
  if (it == std::end(stripe.entries)) {
    return make_failure<submission_state_t>(
        ledger_error_code::not_found,
        fmt::format("submission {} not found", submission_id));
  }
  if (it->second.owner != caller) {
    return make_failure<submission_state_t>(
        ledger_error_code::unauthorized,
        fmt::format("only the owner may review submission {}",
                    submission_id));
  }
  if (it->second.status != submission_status_t::pending) {
    return make_failure<submission_state_t>(
        ledger_error_code::invalid_state,
        fmt::format("submission {} is already {}", submission_id,
                    to_string(it->second.status)));
  }

  auto updated = it->second;
  updated.status = verdict;
  persist(updated);
  it->second = updated;
  spdlog::info("Submission {} marked {}", submission_id, to_string(verdict));
  return make_success(std::move(updated));
}

std::vector<submission_state_t> submission_store::list() const {
  auto out = std::vector<submission_state_t>{};
  submissions_.for_each(
      [&](const submission_id_t, const submission_state_t& state) {
        out.push_back(state);
      });
  std::sort(std::begin(out), std::end(out),
            [](const submission_state_t& lhs, const submission_state_t& rhs) {
              if (lhs.created_at != rhs.created_at) {
                return lhs.created_at > rhs.created_at;
              }
              return lhs.submission_id > rhs.submission_id;
            });
  return out;
}

ledger_statistics submission_store::statistics() const {
  auto stats = ledger_statistics{};
  submissions_.for_each(
      [&](const submission_id_t, const submission_state_t& state) {
        ++stats.total;
        switch (state.status) {
          case submission_status_t::pending:
            ++stats.pending;
            break;
          case submission_status_t::verified:
            ++stats.verified;
            break;
          case submission_status_t::rejected:
            ++stats.rejected;
            break;
        }
        if (state.revealed) {
          ++stats.revealed;
        }
      });
  return stats;
}

void submission_store::persist(const submission_state_t& state) const {
  storage_.put(encoder_, key::make_submission_key(state.submission_id), state);
}

void submission_store::load_persisted_state() {
  spdlog::debug("Loading persisted submissions");
  auto highest = submission_id_t{};
  auto entries =
      storage_.list_by_prefix(make_bytes(key::kSubmissionKeyPrefix));
  for (const auto& [key, value] : entries) {
    auto state = encoder_.decode<submission_state_t>(value);
    highest = std::max(highest, state.submission_id);
    auto& stripe = submissions_.stripe_for(state.submission_id);
    auto lock = std::scoped_lock{stripe.mutex};
    stripe.entries.insert_or_assign(state.submission_id, std::move(state));
  }

  auto sequence = storage_.get<submission_id_t>(
      encoder_, key::make_submission_sequence_key());
  next_id_ = std::max(sequence.value_or(1), highest + 1);
  if (!entries.empty()) {
    spdlog::info("Loaded {} submission(s); next id {}", entries.size(),
                 next_id_);
  }
}

}  // namespace veil::ledger
