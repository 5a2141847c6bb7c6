#pragma once
#include <cosign/schema/session.hpp>
#include <cosign/schema/encoding/scale/field.hpp>
#include <cosign/schema/encoding/scale/recipient.hpp>
#include <cosign/schema/encoding/scale/session_status.hpp>
#include <cosign/schema/encoding/scale/signing_mode.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace cosign::schema {

void encode(const session<1>& o, ::scale::Encoder& encoder);
void decode(session<1>& o, ::scale::Decoder& decoder);

}  // namespace cosign::schema
