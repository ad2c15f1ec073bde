#pragma once

#include <auditchain/ledger/ledger_store.hpp>
#include <auditchain/schema/audit_log_entry.hpp>
#include <cstdint>
#include <optional>

namespace auditchain::ledger {

/// Mutable sensitivity overrides. The flag captured on the entry is never
/// rewritten; an override stored here takes precedence when entries are
/// displayed.
class display_policy final {
 public:
  display_policy(encoder_t& encoder, storage_t& storage);

  /// Throws append_error when the override cannot be persisted.
  void set_sensitive(uint64_t sequence, bool sensitive);

  std::optional<bool> override_for(uint64_t sequence) const;

  bool is_sensitive(const auditchain::schema::audit_log_entry_t& entry) const;

 private:
  encoder_t& encoder_;
  storage_t& storage_;
};

}  // namespace auditchain::ledger
