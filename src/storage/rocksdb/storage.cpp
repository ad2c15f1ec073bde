#include <auditchain/common/critical.hpp>
#include <auditchain/storage/rocksdb/storage.hpp>

namespace auditchain::storage {

namespace {

void ensure_open(const storage<rocksdb_storage_tag>& store) {
  if (!store.database) {
    auditchain::common::critical("RocksDB database is not initialized");
  }
}

ROCKSDB_NAMESPACE::ReadOptions make_read_options(
    const storage<rocksdb_storage_tag>::snapshot_ptr& snapshot) {
  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  read_options.snapshot = snapshot.get();
  return read_options;
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path,
    const storage_options& options) {
  auto store = storage<rocksdb_storage_tag>();
  store.options = options;

  auto db_options = ROCKSDB_NAMESPACE::Options{};
  db_options.create_if_missing = options.create_if_missing;
  db_options.IncreaseParallelism();
  db_options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      options.read_only
          ? ROCKSDB_NAMESPACE::DB::OpenForReadOnly(db_options,
                                                   std::string{path}, &database)
          : ROCKSDB_NAMESPACE::DB::Open(db_options, std::string{path},
                                        &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    auditchain::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}{}", path,
               options.read_only ? " (read-only)" : "");
  store.database.reset(database);

  return store;
}

write_status storage<rocksdb_storage_tag>::write_batch(
    const std::vector<key_value_entry_t>& entries) const {
  ensure_open(*this);
  if (options.read_only) {
    return write_status{.ok = false,
                        .message = "storage is opened read-only"};
  }
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status = batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!put_status.ok()) {
      return write_status{.ok = false, .message = put_status.ToString()};
    }
  }
  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = options.sync_writes;
  auto status = database->Write(write_options, &batch);
  if (!status.ok()) {
    spdlog::error("Failed to write batch into RocksDB: {}", status.ToString());
    return write_status{.ok = false, .message = status.ToString()};
  }
  return write_status{};
}

std::optional<auditchain::schema::bytes_t>
storage<rocksdb_storage_tag>::get_raw(
    const auditchain::schema::bytes_view_t& key,
    const snapshot_ptr& snapshot) const {
  ensure_open(*this);
  auto value = std::string{};
  auto status =
      database->Get(make_read_options(snapshot), detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    auditchain::common::critical("Failed to get value from RocksDB");
  }
  return auditchain::schema::bytes_t(std::begin(value), std::end(value));
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const auditchain::schema::bytes_view_t& prefix,
    const snapshot_ptr& snapshot) const {
  ensure_open(*this);

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto iterator = make_iterator(snapshot);
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    auditchain::common::critical("RocksDB iteration failed");
  }
  return entries;
}

storage<rocksdb_storage_tag>::snapshot_ptr storage<rocksdb_storage_tag>::pin()
    const {
  ensure_open(*this);
  if (options.read_only) {
    return {};
  }
  auto* db = database.get();
  return snapshot_ptr{db->GetSnapshot(),
                      [db](const ROCKSDB_NAMESPACE::Snapshot* snapshot) {
                        db->ReleaseSnapshot(snapshot);
                      }};
}

std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>
storage<rocksdb_storage_tag>::make_iterator(const snapshot_ptr& snapshot) const {
  ensure_open(*this);
  return std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(make_read_options(snapshot))};
}

}  // namespace auditchain::storage
