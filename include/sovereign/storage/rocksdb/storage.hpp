#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <spdlog/spdlog.h>
#include <sovereign/common/critical.hpp>
#include <sovereign/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace sovereign::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const sovereign::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline sovereign::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const sovereign::schema::bytes_view_t& key) const;

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const sovereign::schema::bytes_view_t& key,
           const T& value) const;

  void erase(const sovereign::schema::bytes_view_t& key) const;

  std::vector<key_value_entry_t> list_by_prefix(
      const sovereign::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const sovereign::schema::bytes_view_t& key) const {
  if (!database) {
    sovereign::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    sovereign::common::critical("Failed to get value from RocksDB");
  }
  return encoder.template try_decode<T>(sovereign::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()});
}

template <typename Encoder, typename T>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const sovereign::schema::bytes_view_t& key,
    const T& value) const {
  if (!database) {
    sovereign::common::critical("RocksDB database is not initialized");
  }
  auto encoded = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(
          sovereign::schema::bytes_view_t{encoded.data(), encoded.size()}));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    sovereign::common::critical("Failed to put value into RocksDB");
  }
}

inline void storage<rocksdb_storage_tag>::erase(
    const sovereign::schema::bytes_view_t& key) const {
  if (!database) {
    sovereign::common::critical("RocksDB database is not initialized");
  }
  auto status =
      database->Delete(ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key));
  if (!status.ok()) {
    spdlog::error("Failed to delete key from RocksDB: {}", status.ToString());
    sovereign::common::critical("Failed to delete key from RocksDB");
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const sovereign::schema::bytes_view_t& prefix) const {
  if (!database) {
    sovereign::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_slice = detail::to_slice(prefix);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(prefix_slice);
       iterator->Valid() && iterator->key().starts_with(prefix_slice);
       iterator->Next()) {
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    sovereign::common::critical("RocksDB iteration failed");
  }
  return entries;
}

}  // namespace sovereign::storage
