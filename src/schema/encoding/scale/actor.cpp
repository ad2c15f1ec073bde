#include <auditchain/schema/encoding/scale/actor.hpp>

namespace auditchain::schema {

void encode(const actor_t& o, ::scale::Encoder& encoder) {
  using ::scale::encode;
  encode(o.id, encoder);
  encode(o.name, encoder);
  encode(o.email, encoder);
  encode(o.role, encoder);
}

void decode(actor_t& o, ::scale::Decoder& decoder) {
  using ::scale::decode;
  decode(o.id, decoder);
  decode(o.name, decoder);
  decode(o.email, decoder);
  decode(o.role, decoder);
}

}  // namespace auditchain::schema
