#pragma once

#include <auditchain/schema/audit_verification.hpp>
#include <scale/scale.hpp>

namespace auditchain::schema {

void encode(const audit_verification<1>& o, ::scale::Encoder& encoder);
void decode(audit_verification<1>& o, ::scale::Decoder& decoder);

}  // namespace auditchain::schema
