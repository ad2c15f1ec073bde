#include <auditchain/schema/encoding/scale/ledger_tail.hpp>

namespace auditchain::schema {

void encode(const ledger_tail_t& o, ::scale::Encoder& encoder) {
  using ::scale::encode;
  encode(o.sequence, encoder);
  encode(o.entry_hash, encoder);
  encode(o.timestamp, encoder);
}

void decode(ledger_tail_t& o, ::scale::Decoder& decoder) {
  using ::scale::decode;
  decode(o.sequence, decoder);
  decode(o.entry_hash, decoder);
  decode(o.timestamp, decoder);
}

}  // namespace auditchain::schema
