#pragma once

#include <auditchain/schema/audit_filter.hpp>
#include <auditchain/schema/export_format.hpp>
#include <auditchain/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: export record.
// Audit workflow: a filtered snapshot plus the manifest hash recipients use to
// confirm it was not altered. The export itself is logged as an `export`
// ledger entry; export_sequence points at it.
namespace auditchain::schema {

struct export_record final {
  audit_filter_t filter;
  std::string reason;
  export_format_t format{export_format_t::json};
  std::string payload;
  std::string manifest_hash;
  uint64_t entries_exported{};
  std::string export_type;
  timestamp_milliseconds_t exported_at{};
  std::optional<uint64_t> export_sequence;
  std::optional<std::string> warning;
};

using export_record_t = export_record;

}  // namespace auditchain::schema
