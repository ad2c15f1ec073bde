#pragma once

#include <auditchain/ledger/append_service.hpp>
#include <auditchain/ledger/display_policy.hpp>
#include <auditchain/ledger/export_service.hpp>
#include <auditchain/ledger/ledger_store.hpp>
#include <auditchain/ledger/query_service.hpp>
#include <auditchain/ledger/verifier.hpp>
#include <auditchain/schema/audit_candidate.hpp>
#include <auditchain/schema/audit_filter.hpp>
#include <auditchain/schema/audit_log_entry.hpp>
#include <auditchain/schema/audit_page.hpp>
#include <auditchain/schema/audit_stats.hpp>
#include <auditchain/schema/audit_verification.hpp>
#include <auditchain/schema/export_record.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace auditchain::service {

struct audit_trail_options final {
  std::chrono::milliseconds append_timeout{5000};
  /// Refuse appends after a verification finds a broken chain.
  bool freeze_on_violation{true};
  auditchain::ledger::clock_fn_t clock{
      auditchain::ledger::system_clock_milliseconds};
};

/// The audit trail subsystem.
///
/// Owns the append worker, verifier, query, export and display-policy
/// components over one ledger store and wires verification outcomes into
/// the freeze state. The encoder and storage must outlive it.
class audit_trail final {
 public:
  /// Construct over an opened storage backend.
  ///
  /// Starts frozen when the newest recorded verification found a violation
  /// and `freeze_on_violation` is set.
  audit_trail(auditchain::ledger::encoder_t& encoder,
              auditchain::ledger::storage_t& storage,
              audit_trail_options options = {});

  /// Record one action. See append_service::append for the error contract.
  auditchain::schema::audit_log_entry_t append(
      const auditchain::schema::audit_candidate_t& candidate);

  auditchain::schema::audit_page_t list(
      const auditchain::schema::audit_filter_t& filter,
      uint32_t page = 1,
      uint32_t per_page = auditchain::schema::kDefaultPerPage) const;

  std::optional<auditchain::schema::audit_log_entry_t> get(
      uint64_t sequence) const;

  std::vector<auditchain::schema::audit_log_entry_t> entity_history(
      const std::string& entity_type,
      const std::string& entity_id) const;

  std::vector<auditchain::schema::audit_log_entry_t> user_activity(
      const std::string& actor_id,
      uint32_t days = auditchain::schema::kDefaultStatsDays) const;

  auditchain::schema::audit_stats_t stats(
      uint32_t days = auditchain::schema::kDefaultStatsDays) const;

  /// Full verification. A violation freezes the ledger when configured; a
  /// clean full run lifts an existing freeze.
  auditchain::schema::audit_verification_t verify(std::stop_token stop = {});

  /// Ranged verification. A violation freezes the ledger when configured.
  auditchain::schema::audit_verification_t verify_range(
      uint64_t from,
      uint64_t to,
      const auditchain::schema::hash32_t& anchor,
      std::stop_token stop = {});

  std::vector<auditchain::schema::audit_verification_t> verifications(
      uint32_t limit = auditchain::ledger::kDefaultHistoryLimit) const;

  auditchain::schema::export_record_t export_entries(
      const auditchain::schema::audit_filter_t& filter,
      const std::string& reason,
      auditchain::schema::export_format_t format,
      const auditchain::schema::actor_t& actor);

  /// Override display sensitivity of an existing entry. Returns false when
  /// no entry has that sequence.
  bool set_display_policy(uint64_t sequence, bool sensitive);

  /// Effective sensitivity: the stored override, else the captured flag.
  bool is_sensitive(const auditchain::schema::audit_log_entry_t& entry) const;

  std::optional<auditchain::schema::ledger_tail_t> tail() const;
  bool frozen() const;

 private:
  void apply(const auditchain::schema::audit_verification_t& result,
             bool full_run);

  audit_trail_options options_;
  auditchain::ledger::ledger_store store_;
  auditchain::ledger::display_policy display_;
  auditchain::ledger::verifier verifier_;
  auditchain::ledger::query_service query_;
  auditchain::ledger::append_service appender_;
  auditchain::ledger::export_service exporter_;
};

}  // namespace auditchain::service
