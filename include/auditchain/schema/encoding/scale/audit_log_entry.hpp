#pragma once

#include <auditchain/schema/audit_log_entry.hpp>
#include <scale/scale.hpp>

namespace auditchain::schema {

void encode(const audit_log_entry<1>& o, ::scale::Encoder& encoder);
void decode(audit_log_entry<1>& o, ::scale::Decoder& decoder);

}  // namespace auditchain::schema
