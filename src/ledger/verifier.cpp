#include <auditchain/chain/hash_chain.hpp>
#include <auditchain/common/errors.hpp>
#include <auditchain/ledger/verifier.hpp>
#include <auditchain/schema/key/ledger_keys.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <limits>
#include <memory>

using namespace auditchain::schema;

namespace auditchain::ledger {

namespace {

audit_verification_t make_invalid(audit_verification_t result,
                                  const uint64_t from,
                                  const uint64_t sequence,
                                  std::string reason) {
  result.is_valid = false;
  result.entries_verified = sequence - from;
  result.first_invalid_sequence = sequence;
  result.reason = std::move(reason);
  return result;
}

// Walks SYS|VERIFY| from the highest id down without loading the keyspace.
class history_cursor final {
 public:
  explicit history_cursor(const storage_t& storage)
      : iterator_{storage.make_iterator(storage.pin())} {
    auto last = key::make_verification_key(
        std::numeric_limits<uint64_t>::max());
    iterator_->SeekForPrev(auditchain::storage::detail::to_slice(
        make_bytes_view(last)));
    settle();
  }

  bool valid() const { return id_.has_value(); }
  uint64_t id() const { return *id_; }
  bytes_t value() const {
    return auditchain::storage::detail::to_bytes(iterator_->value());
  }

  void advance() {
    iterator_->Prev();
    settle();
  }

 private:
  void settle() {
    id_.reset();
    if (!iterator_->Valid()) {
      if (!iterator_->status().ok()) {
        spdlog::error("Verification history scan failed: {}",
                      iterator_->status().ToString());
      }
      return;
    }
    auto key_bytes = auditchain::storage::detail::to_bytes(iterator_->key());
    id_ = key::try_parse_sequence_key(key::kVerificationKeyPrefix,
                                      make_bytes_view(key_bytes));
  }

  std::unique_ptr<ROCKSDB_NAMESPACE::Iterator> iterator_;
  std::optional<uint64_t> id_;
};

history_cursor newest_first(const storage_t& storage) {
  return history_cursor{storage};
}

}  // namespace

verifier::verifier(ledger_store& store, clock_fn_t clock)
    : store_{store}, clock_{std::move(clock)} {
  if (!clock_) {
    clock_ = system_clock_milliseconds;
  }
}

audit_verification_t verifier::verify(std::stop_token stop) {
  auto view = store_.view();
  auto result = walk(view, 1, view.size(), chain::genesis_hash(), stop);
  if (!result.cancelled) {
    record(result);
  }
  return result;
}

audit_verification_t verifier::verify_range(const uint64_t from,
                                            const uint64_t to,
                                            const hash32_t& anchor,
                                            std::stop_token stop) {
  if (from == 0) {
    throw common::validation_error{
        "verification range must start at sequence 1 or later"};
  }
  if (from > to) {
    throw common::validation_error{"verification range is inverted: " +
                                   std::to_string(from) + " > " +
                                   std::to_string(to)};
  }
  auto view = store_.view();
  if (from > view.size()) {
    throw common::validation_error{
        "verification range starts past the ledger tail (" +
        std::to_string(view.size()) + ")"};
  }
  auto clamped_to = std::min(to, view.size());

  auto expected_anchor = chain::genesis_hash();
  if (from > 1) {
    auto previous = view.read(from - 1);
    if (!previous || !previous->entry) {
      auto result = audit_verification_t{};
      result.verified_at = clock_();
      result.start_sequence = from;
      result.end_sequence = clamped_to;
      result = make_invalid(
          std::move(result), from - 1, from - 1,
          previous ? std::string{"entry cannot be decoded"}
                   : "sequence " + std::to_string(from - 1) + " is missing");
      spdlog::critical("Ledger verification failed at sequence {}: {}",
                       from - 1, result.reason);
      record(result);
      return result;
    }
    expected_anchor = previous->entry->entry_hash;
  }

  if (expected_anchor != anchor) {
    // Caller error, not a chain finding; never recorded.
    auto result = audit_verification_t{};
    result.verified_at = clock_();
    result.start_sequence = from;
    result.end_sequence = clamped_to;
    result.is_valid = false;
    result.anchor_mismatch = true;
    result.entries_verified = 0;
    result.first_invalid_sequence = from == 1 ? uint64_t{1} : from - 1;
    result.reason = "anchor hash does not match the stored chain";
    spdlog::warn("Range verification [{}, {}] rejected: {}", from, clamped_to,
                 result.reason);
    return result;
  }

  auto result = walk(view, from, clamped_to, anchor, stop);
  if (!result.cancelled) {
    record(result);
  }
  return result;
}

audit_verification_t verifier::walk(const ledger_view& view,
                                    const uint64_t from,
                                    const uint64_t to,
                                    hash32_t prev_hash,
                                    const std::stop_token& stop) const {
  auto result = audit_verification_t{};
  result.start_sequence = from;
  result.end_sequence = to;
  result.verified_at = clock_();

  auto expected = from;
  auto cursor = view.scan_from(from);
  while (expected <= to) {
    if (stop.stop_requested()) {
      result.is_valid = false;
      result.cancelled = true;
      result.entries_verified = expected - from;
      result.reason = "verification cancelled";
      spdlog::warn("Ledger verification cancelled after {} entries",
                   result.entries_verified);
      return result;
    }
    auto slot = cursor.next_record();
    if (!slot || slot->sequence != expected) {
      result = make_invalid(std::move(result), from, expected,
                            "sequence " + std::to_string(expected) +
                                " is missing");
      break;
    }
    if (!slot->entry) {
      result = make_invalid(std::move(result), from, expected,
                            "entry cannot be decoded");
      break;
    }
    const auto& entry = slot->entry;
    if (entry->prev_hash != prev_hash) {
      result = make_invalid(std::move(result), from, expected,
                            "prev_hash does not link to sequence " +
                                std::to_string(expected - 1));
      break;
    }
    auto recomputed = hash32_t{};
    try {
      recomputed = chain::compute_entry_hash(*entry);
    } catch (const common::encoding_error& e) {
      result = make_invalid(std::move(result), from, expected,
                            std::string{"entry cannot be encoded: "} + e.what());
      break;
    }
    if (recomputed != entry->entry_hash) {
      result = make_invalid(std::move(result), from, expected,
                            "entry_hash does not match recomputed hash");
      break;
    }
    prev_hash = entry->entry_hash;
    ++expected;
  }

  if (!result.first_invalid_sequence && to > 0 && to == view.size() &&
      view.tail()->entry_hash != prev_hash) {
    result = make_invalid(std::move(result), from, to,
                          "tail record does not match the last entry");
  }

  if (result.first_invalid_sequence) {
    spdlog::critical("Ledger verification failed at sequence {}: {}",
                     *result.first_invalid_sequence, result.reason);
    return result;
  }
  result.is_valid = true;
  result.entries_verified = to >= from ? to - from + 1 : 0;
  spdlog::info("Ledger verified: {} entries [{}, {}]", result.entries_verified,
               from, to);
  return result;
}

void verifier::record(audit_verification_t& result) {
  auto lock = std::scoped_lock{history_mutex_};
  auto& storage = store_.storage();
  if (storage.options.read_only) {
    spdlog::debug("Read-only ledger; verification not recorded");
    return;
  }
  auto next_id = uint64_t{1};
  auto newest = newest_first(storage);
  if (newest.valid()) {
    next_id = newest.id() + 1;
  }
  result.id = next_id;
  auto record_key = key::make_verification_key(next_id);
  auto status =
      storage.put(store_.encoder(), make_bytes_view(record_key), result);
  if (!status.ok) {
    spdlog::error("Failed to record verification {}: {}", next_id,
                  status.message);
  }
}

std::vector<audit_verification_t> verifier::history(
    const uint32_t limit) const {
  if (limit < 1 || limit > kMaxHistoryLimit) {
    throw common::validation_error{"limit must be between 1 and " +
                                   std::to_string(kMaxHistoryLimit)};
  }
  auto& encoder = store_.encoder();
  auto records = std::vector<audit_verification_t>{};
  for (auto it = newest_first(store_.storage());
       it.valid() && records.size() < limit; it.advance()) {
    auto value = it.value();
    auto decoded =
        encoder.try_decode<audit_verification_t>(make_bytes_view(value));
    if (!decoded) {
      spdlog::error("Verification record {} cannot be decoded; skipped",
                    it.id());
      continue;
    }
    records.push_back(std::move(*decoded));
  }
  return records;
}

std::optional<audit_verification_t> verifier::latest() const {
  auto records = history(1);
  if (records.empty()) {
    return std::nullopt;
  }
  return records.front();
}

}  // namespace auditchain::ledger
