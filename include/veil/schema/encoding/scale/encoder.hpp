#pragma once
#include <veil/common/critical.hpp>
#include <veil/schema/encoding/encoder.hpp>
#include <veil/schema/encoding/scale/ciphertext_type.hpp>
#include <veil/schema/encoding/scale/request_kind.hpp>
#include <veil/schema/encoding/scale/submission_status.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace veil::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  veil::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, veil::schema::bytes_t& out);

  template <typename T>
  T decode(const veil::schema::bytes_view_t& bytes);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
veil::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    veil::common::critical("cannot SCALE-encode ledger record",
                           encoded.error().message());
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        veil::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(const veil::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    veil::common::critical("stored ledger record is not valid SCALE",
                           decoded.error().message());
  }
  return decoded.value();
}

}  // namespace veil::schema::encoding
