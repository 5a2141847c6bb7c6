#pragma once
#include <cosign/schema/audit_event.hpp>
#include <cosign/schema/encoding/scale/audit_action.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace cosign::schema {

void encode(const audit_event<1>& o, ::scale::Encoder& encoder);
void decode(audit_event<1>& o, ::scale::Decoder& decoder);

}  // namespace cosign::schema
