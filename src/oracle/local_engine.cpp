#include <spdlog/spdlog.h>
#include <veil/common/critical.hpp>
#include <veil/oracle/local_engine.hpp>
#include <veil/schema/encoding/scale/encoder.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <tuple>
#include <utility>

using namespace veil::schema;

namespace veil::oracle {

namespace {

constexpr auto kKeyFileSize =
    std::tuple_size_v<veil::crypto::aes256_key_t> +
    std::tuple_size_v<veil::crypto::ed25519_private_key_t>;

bytes_t make_aad(const ciphertext_type_t type) {
  return bytes_t{static_cast<uint8_t>(type)};
}

}  // namespace

std::optional<engine_keys> generate_engine_keys() {
  auto keys = engine_keys{};
  if (!veil::crypto::random_bytes(keys.sealing_key) ||
      !veil::crypto::random_bytes(keys.signing_key)) {
    return std::nullopt;
  }
  return keys;
}

std::optional<engine_keys> load_engine_keys(const std::string_view path) {
  auto input = std::ifstream{std::string{path}, std::ios::binary};
  if (!input) {
    return std::nullopt;
  }
  auto raw = bytes_t(kKeyFileSize + 1);
  input.read(reinterpret_cast<char*>(raw.data()),
             static_cast<std::streamsize>(raw.size()));
  if (static_cast<std::size_t>(input.gcount()) != kKeyFileSize) {
    spdlog::error("Engine key file '{}' must hold exactly {} bytes", path,
                  kKeyFileSize);
    return std::nullopt;
  }
  auto keys = engine_keys{};
  auto cursor = std::begin(raw);
  std::copy_n(cursor, keys.sealing_key.size(), std::begin(keys.sealing_key));
  std::advance(cursor, keys.sealing_key.size());
  std::copy_n(cursor, keys.signing_key.size(), std::begin(keys.signing_key));
  return keys;
}

bool save_engine_keys(const std::string_view path, const engine_keys& keys) {
  {
    auto output = std::ofstream{std::string{path},
                                std::ios::binary | std::ios::trunc};
    if (!output) {
      return false;
    }
    output.write(reinterpret_cast<const char*>(keys.sealing_key.data()),
                 static_cast<std::streamsize>(keys.sealing_key.size()));
    output.write(reinterpret_cast<const char*>(keys.signing_key.data()),
                 static_cast<std::streamsize>(keys.signing_key.size()));
    if (!output) {
      return false;
    }
  }
  auto error = std::error_code{};
  std::filesystem::permissions(std::filesystem::path{path},
                               std::filesystem::perms::owner_read |
                                   std::filesystem::perms::owner_write,
                               std::filesystem::perm_options::replace, error);
  if (error) {
    spdlog::warn("Could not restrict permissions on '{}': {}", path,
                 error.message());
  }
  return true;
}

bytes_t make_proof_message(const request_token_t& token,
                           const cleartexts_t& cleartexts) {
  auto encoder = veil::schema::encoding::scale_encoder_t{};
  return encoder.encode(std::tuple{token, cleartexts});
}

local_engine::local_engine(const engine_keys& keys) : keys_{keys} {
  auto public_key = veil::crypto::derive_public_key(keys_.signing_key);
  if (!public_key) {
    veil::common::critical("failed to derive engine verification key");
  }
  public_key_ = *public_key;
  spdlog::info("Local encryption engine ready (verification key {})",
               to_hex(public_key_));
}

ciphertext_t local_engine::seal_value(const ciphertext_type_t type,
                                      const bytes_view_t& value) const {
  auto aad = make_aad(type);
  auto sealed = veil::crypto::seal(keys_.sealing_key, aad, value);
  if (!sealed) {
    veil::common::critical("AES-GCM sealing failed");
  }
  return ciphertext_t{.version = 1, .type = type, .handle = std::move(*sealed)};
}

std::optional<bytes_t> local_engine::open_value(
    const ciphertext_t& value) const {
  return veil::crypto::open(keys_.sealing_key, make_aad(value.type),
                            value.handle);
}

ciphertext_t local_engine::encrypt(const uint64_t value) const {
  return seal_value(ciphertext_type_t::euint64, encode_uint64_le(value));
}

ciphertext_t local_engine::encrypt(const bytes_view_t& value) const {
  return seal_value(ciphertext_type_t::ebytes, value);
}

ciphertext_t local_engine::encrypt(const std::string_view value) const {
  return encrypt(make_bytes_view(value));
}

ciphertext_t local_engine::encrypt_zero() const {
  return encrypt(uint64_t{0});
}

std::optional<ciphertext_t> local_engine::homomorphic_add(
    const ciphertext_t& lhs,
    const ciphertext_t& rhs) const {
  if (lhs.type != ciphertext_type_t::euint64 ||
      rhs.type != ciphertext_type_t::euint64) {
    return std::nullopt;
  }
  auto lhs_plain = open_value(lhs);
  auto rhs_plain = open_value(rhs);
  if (!lhs_plain || !rhs_plain) {
    return std::nullopt;
  }
  auto a = try_decode_uint64_le(*lhs_plain);
  auto b = try_decode_uint64_le(*rhs_plain);
  if (!a || !b) {
    return std::nullopt;
  }
  // euint64 arithmetic wraps, as FHE integer types do.
  return encrypt(*a + *b);
}

bool local_engine::request_decryption(
    const std::vector<ciphertext_t>& ciphertexts,
    const request_token_t& token) {
  if (ciphertexts.empty()) {
    return false;
  }
  auto lock = std::scoped_lock{mutex_};
  queue_.push_back(queued_request{.token = token, .ciphertexts = ciphertexts});
  spdlog::debug("Queued decryption of {} value(s) for request {}",
                ciphertexts.size(), to_hex(token));
  return true;
}

bool local_engine::verify_decryption_proof(const request_token_t& token,
                                           const cleartexts_t& cleartexts,
                                           const bytes_t& proof) const {
  auto message = make_proof_message(token, cleartexts);
  return veil::crypto::verify_signature(message, public_key_, proof);
}

bool local_engine::available() const {
  return veil::crypto::available();
}

const veil::crypto::ed25519_public_key_t& local_engine::public_key() const {
  return public_key_;
}

void local_engine::set_callback(decryption_callback_t callback) {
  auto lock = std::scoped_lock{mutex_};
  callback_ = std::move(callback);
}

std::size_t local_engine::queued() const {
  auto lock = std::scoped_lock{mutex_};
  return queue_.size();
}

bool local_engine::deliver(const request_token_t& token) {
  auto request = std::optional<queued_request>{};
  {
    auto lock = std::scoped_lock{mutex_};
    auto it = std::find_if(
        std::begin(queue_), std::end(queue_),
        [&](const queued_request& value) { return value.token == token; });
    if (it == std::end(queue_)) {
      return false;
    }
    request = std::move(*it);
    queue_.erase(it);
  }
  return complete(*request);
}

bool local_engine::deliver_next() {
  auto request = std::optional<queued_request>{};
  {
    auto lock = std::scoped_lock{mutex_};
    if (queue_.empty()) {
      return false;
    }
    request = std::move(queue_.front());
    queue_.pop_front();
  }
  return complete(*request);
}

std::size_t local_engine::deliver_all() {
  auto delivered = std::size_t{};
  while (queued() > 0) {
    if (deliver_next()) {
      ++delivered;
    }
  }
  return delivered;
}

bool local_engine::complete(const queued_request& request) {
  auto cleartexts = cleartexts_t{};
  cleartexts.reserve(request.ciphertexts.size());
  for (const auto& value : request.ciphertexts) {
    auto opened = open_value(value);
    if (!opened) {
      spdlog::error("Dropping request {}: envelope does not open under the "
                    "engine key",
                    to_hex(request.token));
      return false;
    }
    cleartexts.push_back(std::move(*opened));
  }

  auto signature = veil::crypto::sign(
      make_proof_message(request.token, cleartexts), keys_.signing_key);
  if (!signature) {
    veil::common::critical("failed to sign decryption proof");
  }

  auto callback = decryption_callback_t{};
  {
    auto lock = std::scoped_lock{mutex_};
    callback = callback_;
  }
  if (!callback) {
    spdlog::warn("No decryption callback installed; request {} discarded",
                 to_hex(request.token));
    return false;
  }
  callback(request.token, cleartexts,
           bytes_t{std::begin(*signature), std::end(*signature)});
  return true;
}

encryption_engine local_engine::bind() {
  return encryption_engine{
      .encrypt_zero = [this]() { return encrypt_zero(); },
      .encrypt_uint64 = [this](const uint64_t value) { return encrypt(value); },
      .homomorphic_add =
          [this](const ciphertext_t& lhs, const ciphertext_t& rhs) {
            return homomorphic_add(lhs, rhs);
          },
      .request_decryption =
          [this](const std::vector<ciphertext_t>& ciphertexts,
                 const request_token_t& token) {
            return request_decryption(ciphertexts, token);
          },
      .verify_decryption_proof =
          [this](const request_token_t& token, const cleartexts_t& cleartexts,
                 const bytes_t& proof) {
            return verify_decryption_proof(token, cleartexts, proof);
          },
      .available = [this]() { return available(); }};
}

}  // namespace veil::oracle
