#pragma once
#include <veil/schema/ciphertext.hpp>
#include <veil/schema/primitives.hpp>
#include <optional>
#include <string>

namespace veil::schema {

template <uint16_t Version>
struct category_bucket;

template <>
struct category_bucket<1> final {
  uint16_t version{1};
  std::string category;
  ciphertext_t encrypted_count;
  // Ids live under their own member keys in fold order; each id appears
  // once across all buckets.
  uint64_t folded_count{};
  std::optional<uint64_t> last_revealed_count;
  std::optional<timestamp_milliseconds_t> last_revealed_at;
};

using category_bucket_t = category_bucket<1>;

struct bucket_count final {
  std::string category;
  uint64_t count{};
};

}  // namespace veil::schema
