#pragma once

#include <auditchain/schema/action_category.hpp>
#include <auditchain/schema/audit_action.hpp>
#include <auditchain/schema/primitives.hpp>
#include <optional>
#include <string>

// Schema type: audit filter.
// Audit workflow: narrowing criteria shared by list, export and the viewer.
// Date bounds are inclusive.
namespace auditchain::schema {

struct audit_filter final {
  std::optional<std::string> entity_type;
  std::optional<std::string> entity_id;
  std::optional<audit_action_t> action;
  std::optional<std::string> actor_id;
  std::optional<action_category_t> action_category;
  std::optional<timestamp_milliseconds_t> date_from;
  std::optional<timestamp_milliseconds_t> date_to;
};

using audit_filter_t = audit_filter;

}  // namespace auditchain::schema
