#pragma once

#include <auditchain/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: audit verification.
// Audit workflow: outcome of walking the hash chain. Not a chain member; kept
// in the verification history keyspace.
namespace auditchain::schema {

template <uint16_t Version>
struct audit_verification;

template <>
struct audit_verification<1> final {
  uint16_t version{1};
  uint64_t id{};
  bool is_valid{};
  uint64_t entries_verified{};
  std::optional<uint64_t> first_invalid_sequence;
  timestamp_milliseconds_t verified_at{};
  uint64_t start_sequence{};
  uint64_t end_sequence{};
  bool cancelled{};
  // The caller-supplied anchor disagreed with the stored chain.
  bool anchor_mismatch{};
  std::string reason;
};

using audit_verification_t = audit_verification<1>;

}  // namespace auditchain::schema
