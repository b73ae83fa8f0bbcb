#pragma once

#include <veil/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: request kind.
// What an outstanding decryption request reveals. Part of the correlation
// key, so a submission and a category bucket never share a slot.
namespace veil::schema {

enum class request_kind_t : uint8_t {
  submission_reveal = 0,
  bucket_count_reveal = 1
};

inline constexpr auto kRequestKindMappings =
    std::array{std::pair<std::string_view, request_kind_t>{
                   "submission_reveal", request_kind_t::submission_reveal},
               std::pair<std::string_view, request_kind_t>{
                   "bucket_count_reveal", request_kind_t::bucket_count_reveal}};

template <>
inline std::optional<request_kind_t> try_from_string<request_kind_t>(
    const std::string_view value) {
  return from_string(value, kRequestKindMappings);
}

inline constexpr std::string_view to_string(const request_kind_t value) {
  return to_string(value, kRequestKindMappings).value_or("unknown");
}

}  // namespace veil::schema
