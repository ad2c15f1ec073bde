#pragma once

#include <auditchain/schema/action_category.hpp>
#include <auditchain/schema/actor.hpp>
#include <auditchain/schema/audit_action.hpp>
#include <auditchain/schema/field_value.hpp>
#include <auditchain/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: audit log entry.
// Audit workflow: one immutable ledger row. Every field except is_sensitive
// and entry_hash is covered by the canonical encoding and therefore by the
// hash chain.
namespace auditchain::schema {

template <uint16_t Version>
struct audit_log_entry;

template <>
struct audit_log_entry<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  timestamp_milliseconds_t timestamp{};
  actor_t actor;
  audit_action_t action{};
  action_category_t action_category{action_category_t::data};
  std::optional<std::string> entity_type;
  std::optional<std::string> entity_id;
  std::optional<std::string> entity_name;
  std::vector<std::string> changed_fields;
  field_map_t old_values;
  field_map_t new_values;
  field_map_t metadata;
  std::optional<std::string> ip_address;
  std::optional<std::string> user_agent;
  std::optional<std::string> request_id;
  std::optional<std::string> session_id;
  bool is_sensitive{};
  hash32_t prev_hash{};
  hash32_t entry_hash{};
};

using audit_log_entry_t = audit_log_entry<1>;

}  // namespace auditchain::schema
