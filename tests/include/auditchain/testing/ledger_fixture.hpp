#pragma once

#include <auditchain/ledger/ledger_store.hpp>
#include <auditchain/schema/key/ledger_keys.hpp>
#include <auditchain/storage/rocksdb/storage.hpp>
#include <auditchain/testing/common.hpp>
#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace auditchain::testing {

/// Temporary RocksDB ledger removed when the fixture goes away.
class ledger_fixture final {
 public:
  explicit ledger_fixture(
      const std::string_view db_prefix,
      const auditchain::storage::storage_options& options = {})
      : db_path_{make_db_path(db_prefix)},
        encoder_{},
        storage_{auditchain::storage::make_storage<
            auditchain::storage::rocksdb_storage_tag>(db_path_, options)} {}

  ledger_fixture(const ledger_fixture&) = delete;
  ledger_fixture& operator=(const ledger_fixture&) = delete;
  ledger_fixture(ledger_fixture&&) = delete;
  ledger_fixture& operator=(ledger_fixture&&) = delete;

  ~ledger_fixture() {
    storage_.database.reset();
    remove_path(db_path_);
  }

  const std::string& db_path() const { return db_path_; }
  auditchain::ledger::encoder_t& encoder() { return encoder_; }
  auditchain::ledger::storage_t& storage() { return storage_; }

  /// Close and reopen the same directory. Objects holding a reference to
  /// storage() see the reopened database.
  void reopen(const auditchain::storage::storage_options& options = {}) {
    storage_.database.reset();
    storage_ = auditchain::storage::make_storage<
        auditchain::storage::rocksdb_storage_tag>(db_path_, options);
  }

  /// Rewrite a stored entry behind the ledger's back.
  void overwrite_entry(const auditchain::schema::audit_log_entry_t& entry) {
    auto key = auditchain::schema::key::make_entry_key(entry.sequence);
    auto status =
        storage_.put(encoder_, auditchain::schema::make_bytes_view(key), entry);
    ASSERT_TRUE(status.ok) << status.message;
  }

  /// Store arbitrary bytes in an entry slot.
  void write_raw_entry(const uint64_t sequence,
                       const auditchain::schema::bytes_t& bytes) {
    auto key = auditchain::schema::key::make_entry_key(sequence);
    auto status = storage_.database->Put(
        ROCKSDB_NAMESPACE::WriteOptions{},
        auditchain::storage::detail::to_slice(
            auditchain::schema::make_bytes_view(key)),
        auditchain::storage::detail::to_slice(
            auditchain::schema::make_bytes_view(bytes)));
    ASSERT_TRUE(status.ok()) << status.ToString();
  }

  /// Remove a stored entry behind the ledger's back.
  void erase_entry(const uint64_t sequence) {
    auto key = auditchain::schema::key::make_entry_key(sequence);
    auto status = storage_.database->Delete(
        ROCKSDB_NAMESPACE::WriteOptions{},
        auditchain::storage::detail::to_slice(
            auditchain::schema::make_bytes_view(key)));
    ASSERT_TRUE(status.ok()) << status.ToString();
  }

 private:
  std::string db_path_;
  auditchain::ledger::encoder_t encoder_;
  auditchain::ledger::storage_t storage_;
};

}  // namespace auditchain::testing
