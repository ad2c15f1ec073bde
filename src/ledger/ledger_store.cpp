#include <auditchain/chain/hash_chain.hpp>
#include <auditchain/common/errors.hpp>
#include <auditchain/ledger/ledger_store.hpp>
#include <auditchain/schema/key/ledger_keys.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

using namespace auditchain::schema;

namespace auditchain::ledger {

namespace {

std::string as_string(const bytes_t& key) {
  return std::string{reinterpret_cast<const char*>(key.data()), key.size()};
}

[[noreturn]] void throw_undecodable(const uint64_t sequence) {
  spdlog::critical("Stored entry {} cannot be decoded", sequence);
  throw common::integrity_violation{
      sequence, "stored entry " + std::to_string(sequence) +
                    " cannot be decoded"};
}

}  // namespace

ledger_cursor::ledger_cursor(
    encoder_t& encoder,
    storage_t::snapshot_ptr snapshot,
    std::unique_ptr<ROCKSDB_NAMESPACE::Iterator> iterator,
    const scan_direction direction,
    const uint64_t start,
    const uint64_t upper_bound)
    : encoder_{&encoder},
      snapshot_{std::move(snapshot)},
      iterator_{std::move(iterator)},
      direction_{direction},
      upper_bound_{upper_bound} {
  if (start == 0 || upper_bound_ == 0 ||
      (direction_ == scan_direction::ascending && start > upper_bound_)) {
    exhausted_ = true;
    return;
  }
  if (direction_ == scan_direction::ascending) {
    iterator_->Seek(as_string(key::make_entry_key(start)));
  } else {
    iterator_->SeekForPrev(
        as_string(key::make_entry_key(std::min(start, upper_bound_))));
  }
}

std::optional<audit_log_entry_t> ledger_cursor::next() {
  auto record = next_record();
  if (!record) {
    return std::nullopt;
  }
  if (!record->entry) {
    throw_undecodable(record->sequence);
  }
  return std::move(record->entry);
}

std::optional<ledger_record> ledger_cursor::next_record() {
  if (exhausted_) {
    return std::nullopt;
  }
  if (!iterator_->Valid()) {
    if (!iterator_->status().ok()) {
      spdlog::error("Ledger scan failed: {}", iterator_->status().ToString());
      auditchain::common::critical("ledger scan failed");
    }
    exhausted_ = true;
    return std::nullopt;
  }
  auto key_bytes = auditchain::storage::detail::to_bytes(iterator_->key());
  auto sequence = key::try_parse_sequence_key(key::kEntryKeyPrefix,
                                              make_bytes_view(key_bytes));
  if (!sequence || *sequence == 0 || *sequence > upper_bound_) {
    exhausted_ = true;
    return std::nullopt;
  }
  auto value = auditchain::storage::detail::to_bytes(iterator_->value());
  auto record = ledger_record{
      .sequence = *sequence,
      .entry = encoder_->try_decode<audit_log_entry_t>(make_bytes_view(value))};
  if (direction_ == scan_direction::ascending) {
    iterator_->Next();
  } else {
    iterator_->Prev();
  }
  return record;
}

ledger_view::ledger_view(encoder_t& encoder,
                         storage_t& storage,
                         storage_t::snapshot_ptr snapshot)
    : encoder_{&encoder}, storage_{&storage}, snapshot_{std::move(snapshot)} {
  auto tail_key = key::make_tail_key();
  tail_ = storage_->get<ledger_tail_t>(*encoder_, make_bytes_view(tail_key),
                                       snapshot_);
}

std::optional<audit_log_entry_t> ledger_view::get(
    const uint64_t sequence) const {
  auto record = read(sequence);
  if (!record) {
    return std::nullopt;
  }
  if (!record->entry) {
    throw_undecodable(sequence);
  }
  return std::move(record->entry);
}

std::optional<ledger_record> ledger_view::read(const uint64_t sequence) const {
  if (sequence == 0 || sequence > size()) {
    return std::nullopt;
  }
  auto entry_key = key::make_entry_key(sequence);
  auto value = storage_->get_raw(make_bytes_view(entry_key), snapshot_);
  if (!value) {
    return std::nullopt;
  }
  return ledger_record{
      .sequence = sequence,
      .entry = encoder_->try_decode<audit_log_entry_t>(make_bytes_view(*value))};
}

ledger_cursor ledger_view::scan_from(const uint64_t sequence) const {
  return ledger_cursor{*encoder_,
                       snapshot_,
                       storage_->make_iterator(snapshot_),
                       scan_direction::ascending,
                       std::max<uint64_t>(sequence, 1),
                       size()};
}

ledger_cursor ledger_view::scan_backward(const uint64_t sequence) const {
  return ledger_cursor{*encoder_,
                       snapshot_,
                       storage_->make_iterator(snapshot_),
                       scan_direction::descending,
                       std::min(sequence, size()),
                       size()};
}

ledger_store::ledger_store(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

void ledger_store::append(const audit_log_entry_t& entry) {
  auto lock = std::scoped_lock{mutex_};
  auto current = tail();
  auto expected_sequence = current ? current->sequence + 1 : uint64_t{1};
  if (entry.sequence != expected_sequence) {
    throw common::sequence_conflict{expected_sequence, entry.sequence};
  }
  auto expected_prev = current ? current->entry_hash : chain::genesis_hash();
  if (entry.prev_hash != expected_prev) {
    throw common::sequence_conflict{
        "prev_hash of sequence " + std::to_string(entry.sequence) +
        " does not match the ledger tail"};
  }

  auto next_tail = ledger_tail_t{.sequence = entry.sequence,
                                 .entry_hash = entry.entry_hash,
                                 .timestamp = entry.timestamp};
  auto status = storage_.write_batch(
      {{key::make_entry_key(entry.sequence), encoder_.encode(entry)},
       {key::make_tail_key(), encoder_.encode(next_tail)}});
  if (!status.ok) {
    throw common::append_error{"failed to persist sequence " +
                               std::to_string(entry.sequence) + ": " +
                               status.message};
  }
}

std::optional<ledger_tail_t> ledger_store::tail() const {
  auto tail_key = key::make_tail_key();
  return storage_.get<ledger_tail_t>(encoder_, make_bytes_view(tail_key));
}

std::optional<audit_log_entry_t> ledger_store::get(
    const uint64_t sequence) const {
  return view().get(sequence);
}

ledger_cursor ledger_store::scan_from(const uint64_t sequence) const {
  return view().scan_from(sequence);
}

ledger_cursor ledger_store::scan_backward(const uint64_t sequence) const {
  return view().scan_backward(sequence);
}

ledger_view ledger_store::view() const {
  return ledger_view{encoder_, storage_, storage_.pin()};
}

}  // namespace auditchain::ledger
