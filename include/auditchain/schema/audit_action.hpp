#pragma once

#include <auditchain/schema/enum_string.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema type: audit action.
// Audit workflow: the verb recorded for every ledger entry. The string form is
// what the list API and the canonical encoding carry.
namespace auditchain::schema {

enum class audit_action_t : uint8_t {
  create = 0,
  update = 1,
  remove = 2,
  view = 3,
  login = 4,
  logout = 5,
  approve = 6,
  reject = 7,
  exported = 8,
};

inline constexpr auto kAuditActionNames =
    std::array<std::pair<std::string_view, audit_action_t>, 9>{{
        {"create", audit_action_t::create},
        {"update", audit_action_t::update},
        {"delete", audit_action_t::remove},
        {"view", audit_action_t::view},
        {"login", audit_action_t::login},
        {"logout", audit_action_t::logout},
        {"approve", audit_action_t::approve},
        {"reject", audit_action_t::reject},
        {"export", audit_action_t::exported},
    }};

constexpr std::string_view to_string(const audit_action_t action) {
  return to_string(action, kAuditActionNames).value_or("unknown");
}

constexpr std::optional<audit_action_t> try_parse_audit_action(
    const std::string_view value) {
  return from_string(value, kAuditActionNames);
}

/// Actions that do not need an audited subject.
constexpr bool is_session_action(const audit_action_t action) {
  return action == audit_action_t::login || action == audit_action_t::logout;
}

}  // namespace auditchain::schema
