#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Schema type: audit stats.
// Audit workflow: windowed aggregate counts for the dashboard.
namespace auditchain::schema {

inline constexpr uint32_t kDefaultStatsDays = 30;
inline constexpr uint32_t kMaxStatsDays = 365;
inline constexpr std::size_t kTopUsersLimit = 10;

struct user_activity_count final {
  std::string actor_id;
  std::optional<std::string> email;
  std::optional<std::string> name;
  uint64_t count{};
};

struct audit_stats final {
  uint64_t total_entries{};
  std::map<std::string, uint64_t> by_action;
  uint64_t unique_users{};
  std::map<std::string, uint64_t> by_entity_type;
  std::vector<user_activity_count> top_users;
  uint32_t period_days{};
};

using audit_stats_t = audit_stats;

}  // namespace auditchain::schema
