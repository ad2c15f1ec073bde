#pragma once

#include <auditchain/schema/field_value.hpp>
#include <scale/scale.hpp>

// Doubles have no SCALE representation; values are stored as a one-byte
// variant index followed by the payload, doubles as their IEEE-754 bits.
namespace auditchain::schema {

void encode(const field_value_t& o, ::scale::Encoder& encoder);
void decode(field_value_t& o, ::scale::Decoder& decoder);

void encode(const field_map_t& o, ::scale::Encoder& encoder);
void decode(field_map_t& o, ::scale::Decoder& decoder);

}  // namespace auditchain::schema
