#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/snapshot.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <auditchain/common/critical.hpp>
#include <auditchain/schema/encoding/scale/encoder.hpp>
#include <auditchain/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string_view>

namespace auditchain::storage {

namespace detail {

inline auditchain::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const auditchain::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  /// Point-in-time view. Readers holding one never observe writes made after
  /// it was taken. Empty for read-only databases, which cannot change.
  using snapshot_ptr = std::shared_ptr<const ROCKSDB_NAMESPACE::Snapshot>;

  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;
  storage_options options;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const auditchain::schema::bytes_view_t& key,
                       const snapshot_ptr& snapshot = {}) const;

  template <typename T, typename Encoder>
  write_status put(Encoder& encoder,
                   const auditchain::schema::bytes_view_t& key,
                   const T& value) const;

  write_status write_batch(const std::vector<key_value_entry_t>& entries) const;

  std::optional<auditchain::schema::bytes_t> get_raw(
      const auditchain::schema::bytes_view_t& key,
      const snapshot_ptr& snapshot = {}) const;

  std::vector<key_value_entry_t> list_by_prefix(
      const auditchain::schema::bytes_view_t& prefix,
      const snapshot_ptr& snapshot = {}) const;

  snapshot_ptr pin() const;

  std::unique_ptr<ROCKSDB_NAMESPACE::Iterator> make_iterator(
      const snapshot_ptr& snapshot) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path,
    const storage_options& options);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const auditchain::schema::bytes_view_t& key,
    const snapshot_ptr& snapshot) const {
  auto value = get_raw(key, snapshot);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(auditchain::schema::bytes_view_t{
      value->data(), value->size()})};
}

template <typename T, typename Encoder>
write_status storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const auditchain::schema::bytes_view_t& key,
    const T& value) const {
  auto encoded_value = encoder.encode(value);
  return write_batch(
      {key_value_entry_t{auditchain::schema::make_bytes(key), encoded_value}});
}

}  // namespace auditchain::storage
