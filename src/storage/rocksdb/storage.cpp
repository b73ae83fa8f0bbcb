#include <veil/common/critical.hpp>
#include <veil/storage/rocksdb/storage.hpp>

#include <memory>
#include <string>

namespace veil::storage {

namespace {

ROCKSDB_NAMESPACE::DB& open_database(
    const std::unique_ptr<ROCKSDB_NAMESPACE::DB>& database) {
  if (!database) {
    veil::common::critical("ledger store is not open");
  }
  return *database;
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  // A corrupt block is as fatal as an undecodable record; surface it early.
  options.paranoid_checks = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    veil::common::critical(fmt::format("cannot open ledger store '{}'", path),
                           status.ToString());
  }
  spdlog::info("Opened ledger store at {}", path);

  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(database);
  return store;
}

void storage<rocksdb_storage_tag>::erase(
    const veil::schema::bytes_view_t& key) const {
  auto status = open_database(database).Delete(
      detail::durable_write_options(), detail::to_slice(key));
  if (!status.ok()) {
    veil::common::critical("ledger store delete failed", status.ToString());
  }
}

void storage<rocksdb_storage_tag>::write(const write_batch& batch) const {
  auto& db = open_database(database);
  auto staged = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& key : batch.erases) {
    auto status = staged.Delete(detail::to_slice(key));
    if (!status.ok()) {
      veil::common::critical("cannot stage delete", status.ToString());
    }
  }
  for (const auto& [key, value] : batch.puts) {
    auto status = staged.Put(detail::to_slice(key), detail::to_slice(value));
    if (!status.ok()) {
      veil::common::critical("cannot stage put", status.ToString());
    }
  }

  auto status = db.Write(detail::durable_write_options(), &staged);
  if (!status.ok()) {
    veil::common::critical("ledger store batch commit failed",
                           status.ToString());
  }
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const veil::schema::bytes_view_t& prefix) const {
  auto& db = open_database(database);
  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator =
      std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{db.NewIterator(read_options)};

  auto entries = std::vector<key_value_entry_t>{};
  auto start = detail::to_slice(prefix);
  for (iterator->Seek(start);
       iterator->Valid() && iterator->key().starts_with(start);
       iterator->Next()) {
    entries.emplace_back(detail::to_bytes(iterator->key()),
                         detail::to_bytes(iterator->value()));
  }
  if (!iterator->status().ok()) {
    veil::common::critical("ledger store scan failed",
                           iterator->status().ToString());
  }
  return entries;
}

}  // namespace veil::storage
