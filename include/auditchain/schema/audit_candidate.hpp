#pragma once

#include <auditchain/schema/action_category.hpp>
#include <auditchain/schema/actor.hpp>
#include <auditchain/schema/audit_action.hpp>
#include <auditchain/schema/field_value.hpp>
#include <optional>
#include <string>
#include <vector>

// Schema type: audit candidate.
// Audit workflow: what a business operation hands to the append service. The
// ledger assigns sequence, timestamp, prev_hash and entry_hash.
namespace auditchain::schema {

struct audit_candidate final {
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
};

using audit_candidate_t = audit_candidate;

}  // namespace auditchain::schema
