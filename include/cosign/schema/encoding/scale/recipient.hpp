#pragma once
#include <cosign/schema/recipient.hpp>
#include <cosign/schema/encoding/scale/recipient_role.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace cosign::schema {

void encode(const recipient<1>& o, ::scale::Encoder& encoder);
void decode(recipient<1>& o, ::scale::Decoder& decoder);

}  // namespace cosign::schema
