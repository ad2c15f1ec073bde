#pragma once

#include <auditchain/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema key type: ledger keys.
// Audit workflow: key prefixes and codecs for ledger entries, the tail
// record, verification history and the display policy overrides.
namespace auditchain::schema::key {

inline constexpr std::string_view kLedgerPrefix{"SYS|LEDGER|"};
inline constexpr std::string_view kEntryKeyPrefix{"SYS|LEDGER|ENTRY|"};
inline constexpr std::string_view kTailKey{"SYS|LEDGER|TAIL"};
inline constexpr std::string_view kVerificationKeyPrefix{"SYS|VERIFY|"};
inline constexpr std::string_view kDisplaySensitiveKeyPrefix{
    "SYS|DISPLAY|SENSITIVE|"};

inline constexpr std::array<std::string_view, 4> kLedgerKeyspaces{
    kEntryKeyPrefix, kTailKey, kVerificationKeyPrefix,
    kDisplaySensitiveKeyPrefix};

auditchain::schema::bytes_t make_prefix_key(std::string_view prefix);
auditchain::schema::bytes_t make_entry_key(uint64_t sequence);
auditchain::schema::bytes_t make_tail_key();
auditchain::schema::bytes_t make_verification_key(uint64_t id);
auditchain::schema::bytes_t make_display_sensitive_key(uint64_t sequence);

/// Recovers the big-endian id that follows `prefix`; nullopt when the key
/// does not belong to that keyspace.
std::optional<uint64_t> try_parse_sequence_key(
    std::string_view prefix,
    const auditchain::schema::bytes_view_t& key);

}  // namespace auditchain::schema::key
