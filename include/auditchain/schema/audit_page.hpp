#pragma once

#include <auditchain/schema/audit_log_entry.hpp>
#include <cstdint>
#include <vector>

// Schema type: audit page.
// Audit workflow: one page of list results, newest first.
namespace auditchain::schema {

inline constexpr uint32_t kDefaultPerPage = 50;
inline constexpr uint32_t kMaxPerPage = 100;

struct audit_page final {
  std::vector<audit_log_entry_t> entries;
  uint32_t page{1};
  uint32_t per_page{kDefaultPerPage};
  uint64_t total{};
};

using audit_page_t = audit_page;

}  // namespace auditchain::schema
