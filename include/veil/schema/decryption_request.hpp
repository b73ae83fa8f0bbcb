#pragma once
#include <veil/schema/primitives.hpp>
#include <veil/schema/request_kind.hpp>
#include <veil/schema/request_target.hpp>

namespace veil::schema {

template <uint16_t Version>
struct decryption_request;

template <>
struct decryption_request<1> final {
  uint16_t version{1};
  request_token_t token{};
  request_kind_t kind{};
  request_target_t target;
  timestamp_milliseconds_t issued_at{};
};

using decryption_request_t = decryption_request<1>;

}  // namespace veil::schema
