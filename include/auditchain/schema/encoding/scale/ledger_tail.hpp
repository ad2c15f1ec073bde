#pragma once

#include <auditchain/schema/ledger_tail.hpp>
#include <scale/scale.hpp>

namespace auditchain::schema {

void encode(const ledger_tail_t& o, ::scale::Encoder& encoder);
void decode(ledger_tail_t& o, ::scale::Decoder& decoder);

}  // namespace auditchain::schema
