#pragma once
#include <cosign/schema/recipient_role.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace cosign::schema {

void encode(const recipient_role_t& o, ::scale::Encoder& encoder);
void decode(recipient_role_t& o, ::scale::Decoder& decoder);

}  // namespace cosign::schema
