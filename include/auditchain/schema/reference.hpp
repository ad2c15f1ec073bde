#pragma once

#include <array>
#include <string_view>

// Reference lists served to clients building filters.
namespace auditchain::schema {

inline constexpr std::array<std::string_view, 7> kDataActions{
    "create", "update", "delete", "view", "export", "approve", "reject"};
inline constexpr std::array<std::string_view, 2> kAuthActions{"login",
                                                             "logout"};

inline constexpr std::array<std::string_view, 14> kAuditableEntityTypes{
    "incident",      "audit",    "audit_finding", "risk",     "complaint",
    "rta",           "document", "policy",        "action",   "investigation",
    "user",          "tenant",   "workflow",      "auth"};

}  // namespace auditchain::schema
