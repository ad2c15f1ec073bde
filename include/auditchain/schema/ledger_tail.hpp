#pragma once

#include <auditchain/schema/primitives.hpp>
#include <cstdint>

// Schema type: ledger tail.
// Audit workflow: newest entry's sequence, hash and timestamp; the only state
// the append worker needs to link the next entry.
namespace auditchain::schema {

struct ledger_tail final {
  uint64_t sequence{};
  hash32_t entry_hash{};
  timestamp_milliseconds_t timestamp{};

  bool operator==(const ledger_tail&) const = default;
};

using ledger_tail_t = ledger_tail;

}  // namespace auditchain::schema
