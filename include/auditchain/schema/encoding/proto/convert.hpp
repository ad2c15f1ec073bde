#pragma once

#include <auditchain/schema/audit_candidate.hpp>
#include <auditchain/schema/audit_filter.hpp>
#include <auditchain/schema/audit_log_entry.hpp>
#include <auditchain/schema/audit_stats.hpp>
#include <auditchain/schema/audit_verification.hpp>
#include <auditchain/schema/field_value.hpp>
#include <auditchain/v1/audit_trail.pb.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/timestamp.pb.h>
#include <string>
#include <string_view>
#include <vector>

// Conversions between ledger types and the auditchain.v1 wire messages.
// Wire -> ledger conversions throw validation_error for unknown enum names
// and encoding_error for values the ledger cannot represent.
namespace auditchain::schema::encoding::proto {

inline constexpr std::string_view kRedacted{"[REDACTED]"};

google::protobuf::Timestamp to_timestamp(timestamp_milliseconds_t value);
timestamp_milliseconds_t from_timestamp(const google::protobuf::Timestamp& value);

google::protobuf::Struct to_struct(const field_map_t& values, bool redact);

/// Whole numbers within +/-2^53 become int64; other numbers stay double.
/// Nested objects and nested lists are rejected with encoding_error.
field_map_t from_struct(const google::protobuf::Struct& values);

/// `redact` replaces every old/new value with "[REDACTED]".
void to_proto(const audit_log_entry_t& entry,
              bool redact,
              auditchain::v1::AuditLogEntry* out);
void to_proto(const audit_verification_t& result,
              auditchain::v1::Verification* out);
void to_proto(const audit_stats_t& stats, auditchain::v1::Stats* out);

actor_t from_proto(const auditchain::v1::Actor& actor);
audit_filter_t from_proto(const auditchain::v1::AuditFilter& filter);
audit_candidate_t from_proto(const auditchain::v1::AppendRequest& request);

/// Serialise with the wire field names, printing defaults.
std::string to_json(const google::protobuf::Message& message);

/// {"entries": [...]} with every value shown.
std::string to_json(const std::vector<audit_log_entry_t>& entries);

}  // namespace auditchain::schema::encoding::proto
