#pragma once

#include <auditchain/schema/audit_log_entry.hpp>
#include <auditchain/schema/encoding/scale/encoder.hpp>
#include <auditchain/schema/ledger_tail.hpp>
#include <auditchain/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

namespace auditchain::ledger {

using encoder_t = auditchain::schema::encoding::encoder<
    auditchain::schema::encoding::scale_encoder_tag>;
using storage_t =
    auditchain::storage::storage<auditchain::storage::rocksdb_storage_tag>;

enum class scan_direction : uint8_t { ascending, descending };

/// Raw view of one stored slot. `entry` is empty when the bytes stored under
/// `sequence` do not decode.
struct ledger_record final {
  uint64_t sequence{};
  std::optional<auditchain::schema::audit_log_entry_t> entry;
};

/// Lazy, restartable walk over stored entries. Bounded by the ledger tail at
/// the time its view was pinned; entries appended later are never yielded.
class ledger_cursor final {
 public:
  ledger_cursor(encoder_t& encoder,
                storage_t::snapshot_ptr snapshot,
                std::unique_ptr<ROCKSDB_NAMESPACE::Iterator> iterator,
                scan_direction direction,
                uint64_t start,
                uint64_t upper_bound);

  /// Next entry in scan order, or std::nullopt once the range is exhausted.
  /// Throws integrity_violation when a stored entry does not decode.
  std::optional<auditchain::schema::audit_log_entry_t> next();

  /// Like next(), but hands undecodable slots back instead of throwing.
  std::optional<ledger_record> next_record();

 private:
  encoder_t* encoder_;
  storage_t::snapshot_ptr snapshot_;
  std::unique_ptr<ROCKSDB_NAMESPACE::Iterator> iterator_;
  scan_direction direction_;
  uint64_t upper_bound_{};
  bool exhausted_{};
};

/// Consistent read view of the ledger pinned at one point in time.
class ledger_view final {
 public:
  ledger_view(encoder_t& encoder,
              storage_t& storage,
              storage_t::snapshot_ptr snapshot);

  const std::optional<auditchain::schema::ledger_tail_t>& tail() const {
    return tail_;
  }
  uint64_t size() const { return tail_ ? tail_->sequence : 0; }

  /// Throws integrity_violation when the stored entry does not decode.
  std::optional<auditchain::schema::audit_log_entry_t> get(
      uint64_t sequence) const;

  std::optional<ledger_record> read(uint64_t sequence) const;

  /// Ascending from `sequence` (clamped to 1) up to the pinned tail.
  ledger_cursor scan_from(uint64_t sequence) const;

  /// Descending from `sequence` (clamped to the pinned tail) down to 1.
  ledger_cursor scan_backward(uint64_t sequence) const;

  const storage_t::snapshot_ptr& snapshot() const { return snapshot_; }

 private:
  encoder_t* encoder_;
  storage_t* storage_;
  storage_t::snapshot_ptr snapshot_;
  std::optional<auditchain::schema::ledger_tail_t> tail_;
};

/// Durable, append-only entry store. There is no update or delete path; the
/// only writer is append(), which links each entry to the current tail or
/// refuses it.
class ledger_store final {
 public:
  ledger_store(encoder_t& encoder, storage_t& storage);

  /// Persist `entry` and advance the tail in one atomic write batch.
  ///
  /// Throws sequence_conflict when entry.sequence is not tail + 1 or
  /// entry.prev_hash is not the tail hash, append_error when the write fails.
  void append(const auditchain::schema::audit_log_entry_t& entry);

  std::optional<auditchain::schema::ledger_tail_t> tail() const;
  std::optional<auditchain::schema::audit_log_entry_t> get(
      uint64_t sequence) const;

  ledger_cursor scan_from(uint64_t sequence) const;
  ledger_cursor scan_backward(uint64_t sequence) const;

  /// Pin a snapshot for multi-step reads that must agree with each other.
  ledger_view view() const;

  encoder_t& encoder() const { return encoder_; }
  storage_t& storage() const { return storage_; }

 private:
  mutable std::mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
};

}  // namespace auditchain::ledger
