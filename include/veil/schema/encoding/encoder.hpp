#pragma once
#include <veil/schema/primitives.hpp>
#include <span>

namespace veil::schema::encoding {

/// Build-time selected codec. The tag names the wire library; every
/// persisted record goes through one of these.
template <typename Library>
struct encoder {
  template <typename T>
  veil::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, veil::schema::bytes_t& out);

  template <typename T>
  T decode(const veil::schema::bytes_view_t& bytes);
};

}  // namespace veil::schema::encoding
