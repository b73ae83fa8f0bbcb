#pragma once
#include <veil/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace veil::storage {

using key_value_entry_t =
    std::pair<veil::schema::bytes_t, veil::schema::bytes_t>;

/// Puts and deletes committed together or not at all.
struct write_batch final {
  std::vector<key_value_entry_t> puts;
  std::vector<veil::schema::bytes_t> erases;
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const veil::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const veil::schema::bytes_view_t& key,
           const T& value) const;

  /// Remove key; a missing key is not an error.
  void erase(const veil::schema::bytes_view_t& key) const;

  /// Atomically apply every put and erase in the batch.
  void write(const write_batch& batch) const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const veil::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace veil::storage
