#include <auditchain/schema/encoding/scale/action_category.hpp>
#include <auditchain/schema/encoding/scale/actor.hpp>
#include <auditchain/schema/encoding/scale/audit_action.hpp>
#include <auditchain/schema/encoding/scale/audit_log_entry.hpp>
#include <auditchain/schema/encoding/scale/field_value.hpp>

namespace auditchain::schema {

void encode(const audit_log_entry<1>& o, ::scale::Encoder& encoder) {
  using ::scale::encode;
  encode(o.version, encoder);
  encode(o.sequence, encoder);
  encode(o.timestamp, encoder);
  schema::encode(o.actor, encoder);
  encode(o.action, encoder);
  encode(o.action_category, encoder);
  encode(o.entity_type, encoder);
  encode(o.entity_id, encoder);
  encode(o.entity_name, encoder);
  encode(o.changed_fields, encoder);
  schema::encode(o.old_values, encoder);
  schema::encode(o.new_values, encoder);
  schema::encode(o.metadata, encoder);
  encode(o.ip_address, encoder);
  encode(o.user_agent, encoder);
  encode(o.request_id, encoder);
  encode(o.session_id, encoder);
  encode(o.is_sensitive, encoder);
  encode(o.prev_hash, encoder);
  encode(o.entry_hash, encoder);
}

void decode(audit_log_entry<1>& o, ::scale::Decoder& decoder) {
  using ::scale::decode;
  decode(o.version, decoder);
  decode(o.sequence, decoder);
  decode(o.timestamp, decoder);
  schema::decode(o.actor, decoder);
  decode(o.action, decoder);
  decode(o.action_category, decoder);
  decode(o.entity_type, decoder);
  decode(o.entity_id, decoder);
  decode(o.entity_name, decoder);
  decode(o.changed_fields, decoder);
  schema::decode(o.old_values, decoder);
  schema::decode(o.new_values, decoder);
  schema::decode(o.metadata, decoder);
  decode(o.ip_address, decoder);
  decode(o.user_agent, decoder);
  decode(o.request_id, decoder);
  decode(o.session_id, decoder);
  decode(o.is_sensitive, decoder);
  decode(o.prev_hash, decoder);
  decode(o.entry_hash, decoder);
}

}  // namespace auditchain::schema
