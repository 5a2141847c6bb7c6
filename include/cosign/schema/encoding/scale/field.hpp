#pragma once
#include <cosign/schema/field.hpp>
#include <cosign/schema/encoding/scale/field_type.hpp>
#include <cosign/schema/encoding/scale/field_value.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace cosign::schema {

void encode(const field_rect_t& o, ::scale::Encoder& encoder);
void decode(field_rect_t& o, ::scale::Decoder& decoder);
void encode(const field<1>& o, ::scale::Encoder& encoder);
void decode(field<1>& o, ::scale::Decoder& decoder);

}  // namespace cosign::schema
