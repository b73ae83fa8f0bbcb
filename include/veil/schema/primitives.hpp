#pragma once
#include <array>
#include <cstddef>
#include <boost/endian/buffers.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace veil::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using principal_id_t = hash32_t;  // Wallet/identity reference, authenticated upstream
using submission_id_t = uint64_t;
using request_token_t = hash32_t;
using timestamp_milliseconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);

/// Fixed 8-byte little-endian cleartext used for decrypted euint64 values.
bytes_t encode_uint64_le(uint64_t value);
std::optional<uint64_t> try_decode_uint64_le(const bytes_view_t& bytes);

/// Fixed 8-byte big-endian form; keeps RocksDB prefix scans in numeric order.
bytes_t encode_uint64_be(uint64_t value);
std::optional<uint64_t> try_decode_uint64_be(const bytes_view_t& bytes);

/// Hash for unordered containers keyed by a 32-byte digest or token.
struct hash32_hasher final {
  std::size_t operator()(const hash32_t& value) const noexcept;
};

}  // namespace veil::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
