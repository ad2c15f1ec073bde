#pragma once

#include <auditchain/ledger/append_service.hpp>
#include <auditchain/ledger/ledger_store.hpp>
#include <auditchain/schema/audit_verification.hpp>
#include <auditchain/schema/primitives.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stop_token>
#include <vector>

namespace auditchain::ledger {

inline constexpr uint32_t kDefaultHistoryLimit = 10;
inline constexpr uint32_t kMaxHistoryLimit = 50;

/// Walks the hash chain and reports the first entry that breaks it.
///
/// Read-only over the ledger and safe to run concurrently with appends: each
/// run pins a snapshot and checks exactly the entries present when it began.
/// Completed runs are recorded in the verification history unless the
/// storage was opened read-only.
class verifier final {
 public:
  explicit verifier(ledger_store& store,
                    clock_fn_t clock = system_clock_milliseconds);

  /// Verify every entry from genesis to the tail.
  auditchain::schema::audit_verification_t verify(std::stop_token stop = {});

  /// Verify [from, to] starting from a trusted anchor hash, the entry_hash
  /// of `from - 1` (the genesis hash when `from == 1`). `to` past the tail is
  /// clamped. Throws validation_error for an empty or inverted range.
  auditchain::schema::audit_verification_t verify_range(
      uint64_t from,
      uint64_t to,
      const auditchain::schema::hash32_t& anchor,
      std::stop_token stop = {});

  /// Recorded verifications, newest first. Throws validation_error unless
  /// 1 <= limit <= 50.
  std::vector<auditchain::schema::audit_verification_t> history(
      uint32_t limit = kDefaultHistoryLimit) const;

  std::optional<auditchain::schema::audit_verification_t> latest() const;

 private:
  auditchain::schema::audit_verification_t walk(
      const ledger_view& view,
      uint64_t from,
      uint64_t to,
      auditchain::schema::hash32_t prev_hash,
      const std::stop_token& stop) const;

  void record(auditchain::schema::audit_verification_t& result);

  ledger_store& store_;
  clock_fn_t clock_;
  std::mutex history_mutex_;
};

}  // namespace auditchain::ledger
