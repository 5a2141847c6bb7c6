#pragma once
#include <cosign/schema/audit_action.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace cosign::schema {

void encode(const audit_action_t& o, ::scale::Encoder& encoder);
void decode(audit_action_t& o, ::scale::Decoder& decoder);

}  // namespace cosign::schema
