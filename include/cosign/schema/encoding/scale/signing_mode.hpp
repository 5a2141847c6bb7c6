#pragma once
#include <cosign/schema/signing_mode.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace cosign::schema {

void encode(const signing_mode_t& o, ::scale::Encoder& encoder);
void decode(signing_mode_t& o, ::scale::Decoder& decoder);

}  // namespace cosign::schema
