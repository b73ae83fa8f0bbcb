#include <spdlog/spdlog.h>
#include <veil/blake3/hash.hpp>
#include <veil/common/critical.hpp>
#include <veil/crypto/signing.hpp>
#include <veil/ledger/request_correlator.hpp>
#include <veil/schema/key/ledger_keys.hpp>

#include <algorithm>
#include <iterator>
#include <mutex>
#include <utility>

using namespace veil::schema;

namespace veil::ledger {

request_correlator::request_correlator(
    veil::schema::encoding::scale_encoder_t& encoder,
    veil::storage::rocksdb_storage_t& storage)
    : encoder_{encoder}, storage_{storage} {
  load_persisted_state();
}

std::string request_correlator::make_slot_key(const request_target_t& target,
                                              const request_kind_t kind) {
  auto slot = std::string(1, static_cast<char>(kind));
  std::visit(overloaded{[&](const submission_ref& ref) {
                          auto id = encode_uint64_be(ref.submission_id);
                          slot.append(std::begin(id), std::end(id));
                        },
                        [&](const bucket_ref& ref) {
                          slot.append(ref.category);
                        }},
             target);
  return slot;
}

request_token_t request_correlator::mint_token(const std::string& slot_key) {
  auto material = bytes_t(32);
  if (!veil::crypto::random_bytes(material)) {
    veil::common::critical("failed to gather entropy for a request token");
  }
  material.insert(std::end(material), std::begin(slot_key),
                  std::end(slot_key));
  return veil::blake3::hash(bytes_view_t{material});
}

operation_result<request_token_t> request_correlator::issue(
    const request_target_t& target,
    const request_kind_t kind,
    const timestamp_milliseconds_t issued_at,
    const dispatch_t& dispatch) {
  if (kind != expected_kind(target)) {
    return make_failure<request_token_t>(
        ledger_error_code::invalid_argument,
        fmt::format("{} cannot be issued for {}", to_string(kind),
                    describe(target)));
  }

  auto slot_key = make_slot_key(target, kind);
  auto token = request_token_t{};
  {
    auto& slot_stripe = slots_.stripe_for(slot_key);
    auto slot_lock = std::scoped_lock{slot_stripe.mutex};
    if (slot_stripe.entries.contains(slot_key)) {
      return make_failure<request_token_t>(
          ledger_error_code::already_pending,
          fmt::format("{} already has a pending {}", describe(target),
                      to_string(kind)));
    }

    token = mint_token(slot_key);
    auto request = decryption_request_t{.version = 1,
                                        .token = token,
                                        .kind = kind,
                                        .target = target,
                                        .issued_at = issued_at};
    storage_.put(encoder_, key::make_request_key(token), request);
    {
      auto& token_stripe = requests_.stripe_for(token);
      auto token_lock = std::scoped_lock{token_stripe.mutex};
      if (!token_stripe.entries.emplace(token, std::move(request)).second) {
        veil::common::critical("request token collision");
      }
    }
    slot_stripe.entries.emplace(slot_key, token);
  }

  // Dispatch outside the slot lock; an oracle that answers inline re-enters
  // resolve on the same slot.
  if (!dispatch(token)) {
    auto& slot_stripe = slots_.stripe_for(slot_key);
    auto slot_lock = std::scoped_lock{slot_stripe.mutex};
    auto it = slot_stripe.entries.find(slot_key);
    if (it != std::end(slot_stripe.entries) && it->second == token) {
      release(slot_key, token);
    }
    spdlog::warn("Oracle refused {} for {}", to_string(kind),
                 describe(target));
    return make_failure<request_token_t>(
        ledger_error_code::oracle_unavailable,
        "decryption oracle did not accept the request");
  }

  spdlog::info("Issued {} for {} as {}", to_string(kind), describe(target),
               to_hex(token));
  return make_success(token);
}

operation_result<decryption_request_t> request_correlator::resolve(
    const request_token_t& token,
    const authenticator_t& authenticate,
    const committer_t& commit) {
  auto request = find(token);
  if (!request) {
    spdlog::warn("Rejected callback for unknown request {}", to_hex(token));
    return make_failure<decryption_request_t>(
        ledger_error_code::unknown_request, "unknown request token");
  }

  auto slot_key = make_slot_key(request->target, request->kind);
  auto& slot_stripe = slots_.stripe_for(slot_key);
  auto slot_lock = std::scoped_lock{slot_stripe.mutex};
  auto it = slot_stripe.entries.find(slot_key);
  if (it == std::end(slot_stripe.entries) || it->second != token) {
    // Consumed or cleared between the lookup and taking the slot.
    spdlog::warn("Rejected callback for unknown request {}", to_hex(token));
    return make_failure<decryption_request_t>(
        ledger_error_code::unknown_request, "unknown request token");
  }

  auto verdict = authenticate(*request);
  if (!verdict.ok()) {
    return forward_failure<decryption_request_t>(verdict);
  }
  if (commit) {
    commit(*request);
  }

  release(slot_key, token);
  spdlog::debug("Resolved {} for {}", to_string(request->kind),
                describe(request->target));
  return make_success(std::move(*request));
}

std::optional<decryption_request_t> request_correlator::find(
    const request_token_t& token) const {
  const auto& stripe = requests_.stripe_for(token);
  auto lock = std::scoped_lock{stripe.mutex};
  auto it = stripe.entries.find(token);
  if (it == std::end(stripe.entries)) {
    return std::nullopt;
  }
  return it->second;
}

bool request_correlator::is_pending(const request_target_t& target,
                                    const request_kind_t kind) const {
  auto slot_key = make_slot_key(target, kind);
  const auto& stripe = slots_.stripe_for(slot_key);
  auto lock = std::scoped_lock{stripe.mutex};
  return stripe.entries.contains(slot_key);
}

operation_result<decryption_request_t> request_correlator::force_clear(
    const request_target_t& target,
    const request_kind_t kind) {
  auto slot_key = make_slot_key(target, kind);
  auto& slot_stripe = slots_.stripe_for(slot_key);
  auto slot_lock = std::scoped_lock{slot_stripe.mutex};
  auto it = slot_stripe.entries.find(slot_key);
  if (it == std::end(slot_stripe.entries)) {
    return make_failure<decryption_request_t>(
        ledger_error_code::not_found,
        fmt::format("no pending {} for {}", to_string(kind),
                    describe(target)));
  }

  auto token = it->second;
  auto request = find(token);
  release(slot_key, token);
  spdlog::warn("Force-cleared {} for {} (token {})", to_string(kind),
               describe(target), to_hex(token));
  if (!request) {
    veil::common::critical("pending slot without a request record");
  }
  return make_success(std::move(*request));
}

std::vector<decryption_request_t> request_correlator::outstanding() const {
  auto out = std::vector<decryption_request_t>{};
  requests_.for_each(
      [&](const request_token_t&, const decryption_request_t& request) {
        out.push_back(request);
      });
  std::sort(std::begin(out), std::end(out),
            [](const decryption_request_t& lhs,
               const decryption_request_t& rhs) {
              return lhs.issued_at < rhs.issued_at;
            });
  return out;
}

void request_correlator::release(const std::string& slot_key,
                                 const request_token_t& token) {
  storage_.erase(key::make_request_key(token));
  {
    auto& token_stripe = requests_.stripe_for(token);
    auto token_lock = std::scoped_lock{token_stripe.mutex};
    token_stripe.entries.erase(token);
  }
  slots_.stripe_for(slot_key).entries.erase(slot_key);
}

void request_correlator::load_persisted_state() {
  spdlog::debug("Loading outstanding decryption requests");
  auto entries = storage_.list_by_prefix(make_bytes(key::kRequestKeyPrefix));
  for (const auto& [key, value] : entries) {
    auto request = encoder_.decode<decryption_request_t>(value);
    auto slot_key = make_slot_key(request.target, request.kind);
    {
      auto& slot_stripe = slots_.stripe_for(slot_key);
      auto lock = std::scoped_lock{slot_stripe.mutex};
      slot_stripe.entries.insert_or_assign(slot_key, request.token);
    }
    auto& token_stripe = requests_.stripe_for(request.token);
    auto lock = std::scoped_lock{token_stripe.mutex};
    token_stripe.entries.insert_or_assign(request.token, std::move(request));
  }
  if (!entries.empty()) {
    spdlog::info("Restored {} outstanding decryption request(s)",
                 entries.size());
  }
}

}  // namespace veil::ledger
