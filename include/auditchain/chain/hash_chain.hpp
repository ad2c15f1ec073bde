#pragma once
#include <auditchain/schema/audit_log_entry.hpp>
#include <auditchain/schema/primitives.hpp>

namespace auditchain::chain {

/// prev_hash of the first entry: 32 zero bytes.
auditchain::schema::hash32_t genesis_hash();

/// SHA-256(prev_hash || canonical_bytes).
auditchain::schema::hash32_t compute_hash(
    const auditchain::schema::hash32_t& prev_hash,
    const auditchain::schema::bytes_view_t& canonical_bytes);

/// Hash `entry` as stored: canonical encoding of every hashed field chained
/// onto entry.prev_hash. entry.entry_hash is ignored.
auditchain::schema::hash32_t compute_entry_hash(
    const auditchain::schema::audit_log_entry_t& entry);

}  // namespace auditchain::chain
