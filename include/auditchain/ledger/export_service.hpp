#pragma once

#include <auditchain/ledger/append_service.hpp>
#include <auditchain/ledger/ledger_store.hpp>
#include <auditchain/schema/actor.hpp>
#include <auditchain/schema/audit_filter.hpp>
#include <auditchain/schema/audit_log_entry.hpp>
#include <auditchain/schema/export_record.hpp>
#include <string>
#include <vector>

namespace auditchain::ledger {

inline constexpr std::string_view kExportEntityType{"audit_log"};

/// RFC 4180 document with a header row, one line per entry.
std::string to_csv(
    const std::vector<auditchain::schema::audit_log_entry_t>& entries);

/// Filtered snapshot of the ledger plus its manifest hash. Every export is
/// itself recorded on the ledger as an `export` entry.
class export_service final {
 public:
  export_service(ledger_store& store,
                 append_service& appender,
                 clock_fn_t clock = system_clock_milliseconds);

  /// Throws validation_error when `reason` is blank. When the snapshot was
  /// produced but logging it failed, the record is returned with `warning`
  /// set.
  auditchain::schema::export_record_t export_entries(
      const auditchain::schema::audit_filter_t& filter,
      const std::string& reason,
      auditchain::schema::export_format_t format,
      const auditchain::schema::actor_t& actor);

 private:
  ledger_store& store_;
  append_service& appender_;
  clock_fn_t clock_;
};

}  // namespace auditchain::ledger
