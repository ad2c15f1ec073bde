#pragma once

#include <auditchain/ledger/append_service.hpp>
#include <auditchain/ledger/ledger_store.hpp>
#include <auditchain/schema/audit_filter.hpp>
#include <auditchain/schema/audit_log_entry.hpp>
#include <auditchain/schema/audit_page.hpp>
#include <auditchain/schema/audit_stats.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace auditchain::ledger {

inline constexpr std::size_t kUserActivityLimit = 100;

/// True when `entry` satisfies every criterion set on `filter`.
bool matches(const auditchain::schema::audit_filter_t& filter,
             const auditchain::schema::audit_log_entry_t& entry);

/// Every entry of `view` matching `filter`, newest first.
std::vector<auditchain::schema::audit_log_entry_t> collect(
    const ledger_view& view,
    const auditchain::schema::audit_filter_t& filter);

/// Read side of the ledger: filtered pages, per-subject histories and
/// windowed statistics. Every call reads from one pinned view.
class query_service final {
 public:
  explicit query_service(ledger_store& store,
                         clock_fn_t clock = system_clock_milliseconds);

  /// Matching entries ordered by sequence descending. Throws
  /// validation_error unless page >= 1 and 1 <= per_page <= 100.
  auditchain::schema::audit_page_t list(
      const auditchain::schema::audit_filter_t& filter,
      uint32_t page = 1,
      uint32_t per_page = auditchain::schema::kDefaultPerPage) const;

  std::optional<auditchain::schema::audit_log_entry_t> get(
      uint64_t sequence) const;

  /// Every entry about one subject, oldest first.
  std::vector<auditchain::schema::audit_log_entry_t> entity_history(
      const std::string& entity_type,
      const std::string& entity_id) const;

  /// An actor's entries inside the last `days` days, newest first, at most
  /// 100 of them.
  std::vector<auditchain::schema::audit_log_entry_t> user_activity(
      const std::string& actor_id,
      uint32_t days = auditchain::schema::kDefaultStatsDays) const;

  /// Aggregates over entries with timestamp >= now - days. Throws
  /// validation_error unless 1 <= days <= 365.
  auditchain::schema::audit_stats_t stats(
      uint32_t days = auditchain::schema::kDefaultStatsDays) const;

 private:
  auditchain::schema::timestamp_milliseconds_t window_start(
      uint32_t days) const;

  ledger_store& store_;
  clock_fn_t clock_;
};

}  // namespace auditchain::ledger
