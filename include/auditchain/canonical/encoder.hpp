#pragma once
#include <auditchain/schema/audit_candidate.hpp>
#include <auditchain/schema/audit_log_entry.hpp>
#include <auditchain/schema/field_value.hpp>
#include <auditchain/schema/key/builder.hpp>
#include <auditchain/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Canonical encoding of a ledger entry: the exact bytes the hash chain
// commits to. Field order, tags and value layout are part of the on-disk
// contract; changing any of them invalidates every stored hash.
namespace auditchain::canonical {

/// One-byte field tags, in write order.
enum class field_tag : uint8_t {
  version = 1,
  sequence = 2,
  timestamp = 3,
  actor_id = 4,
  actor_name = 5,
  actor_email = 6,
  actor_role = 7,
  action = 8,
  action_category = 9,
  entity_type = 10,
  entity_id = 11,
  entity_name = 12,
  changed_fields = 13,
  old_values = 14,
  new_values = 15,
  metadata = 16,
  ip_address = 17,
  user_agent = 18,
  request_id = 19,
  session_id = 20,
  prev_hash = 21,
};

/// Value type tags; they equal the field_value_t alternative index.
enum class value_tag : uint8_t {
  null = 0,
  boolean = 1,
  integer = 2,
  real = 3,
  text = 4,
  list = 5,
};

/// Byte writer for the canonical layout. Throws encoding_error on values
/// that have no canonical form.
class writer final {
 public:
  writer& tag(field_tag tag);
  writer& u16(uint16_t value);
  writer& u64(uint64_t value);
  writer& text(const std::string_view& value);
  writer& optional_text(const std::optional<std::string>& value);
  writer& names(const std::vector<std::string>& values);
  writer& values(const auditchain::schema::field_map_t& values);
  writer& value(const auditchain::schema::field_value_t& value);
  writer& raw(const auditchain::schema::bytes_view_t& bytes);

  const auditchain::schema::bytes_t& bytes() const { return builder_.data; }
  auditchain::schema::bytes_t take() { return std::move(builder_.data); }

 private:
  auditchain::schema::key::builder builder_;
};

/// Canonical bytes of `entry` excluding is_sensitive and entry_hash.
auditchain::schema::bytes_t encode(
    const auditchain::schema::audit_log_entry_t& entry);

bool is_valid_utf8(const std::string_view& value);

void validate(const auditchain::schema::field_value_t& value);
void validate(const auditchain::schema::field_map_t& values);

/// Runs every check encode() would run on the candidate's fields, so
/// malformed input fails before a sequence number is assigned.
void validate(const auditchain::schema::audit_candidate_t& candidate);

}  // namespace auditchain::canonical
