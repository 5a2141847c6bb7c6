#pragma once
#include <cosign/schema/field_type.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace cosign::schema {

void encode(const field_type_t& o, ::scale::Encoder& encoder);
void decode(field_type_t& o, ::scale::Decoder& decoder);

}  // namespace cosign::schema
