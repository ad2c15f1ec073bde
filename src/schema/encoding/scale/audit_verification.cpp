#include <auditchain/schema/encoding/scale/audit_verification.hpp>

namespace auditchain::schema {

void encode(const audit_verification<1>& o, ::scale::Encoder& encoder) {
  using ::scale::encode;
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.is_valid, encoder);
  encode(o.entries_verified, encoder);
  encode(o.first_invalid_sequence, encoder);
  encode(o.verified_at, encoder);
  encode(o.start_sequence, encoder);
  encode(o.end_sequence, encoder);
  encode(o.cancelled, encoder);
  encode(o.anchor_mismatch, encoder);
  encode(o.reason, encoder);
}

void decode(audit_verification<1>& o, ::scale::Decoder& decoder) {
  using ::scale::decode;
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.is_valid, decoder);
  decode(o.entries_verified, decoder);
  decode(o.first_invalid_sequence, decoder);
  decode(o.verified_at, decoder);
  decode(o.start_sequence, decoder);
  decode(o.end_sequence, decoder);
  decode(o.cancelled, decoder);
  decode(o.anchor_mismatch, decoder);
  decode(o.reason, decoder);
}

}  // namespace auditchain::schema
