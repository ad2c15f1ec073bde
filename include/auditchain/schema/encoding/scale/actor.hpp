#pragma once

#include <auditchain/schema/actor.hpp>
#include <scale/scale.hpp>

namespace auditchain::schema {

void encode(const actor_t& o, ::scale::Encoder& encoder);
void decode(actor_t& o, ::scale::Decoder& decoder);

}  // namespace auditchain::schema
