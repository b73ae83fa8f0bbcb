#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <veil/common/critical.hpp>
#include <veil/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace veil::storage {

namespace detail {

inline veil::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const veil::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

/// Ledger records are acknowledged to callers as soon as they are written,
/// so every write reaches the WAL with a sync.
inline ROCKSDB_NAMESPACE::WriteOptions durable_write_options() {
  auto options = ROCKSDB_NAMESPACE::WriteOptions{};
  options.sync = true;
  return options;
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const veil::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const veil::schema::bytes_view_t& key,
           const T& value) const;

  void erase(const veil::schema::bytes_view_t& key) const;
  void write(const write_batch& batch) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const veil::schema::bytes_view_t& prefix) const;
};

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const veil::schema::bytes_view_t& key) const {
  if (!database) {
    veil::common::critical("ledger store is not open");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    veil::common::critical("ledger store read failed", status.ToString());
  }
  return {encoder.template decode<T>(veil::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const veil::schema::bytes_view_t& key,
                                       const T& value) const {
  if (!database) {
    veil::common::critical("ledger store is not open");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(detail::durable_write_options(),
                              detail::to_slice(key),
                              detail::to_slice(encoded_value));
  if (!status.ok()) {
    veil::common::critical("ledger store write failed", status.ToString());
  }
}

}  // namespace veil::storage
