#pragma once
#include <cosign/schema/field_value.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace cosign::schema {

void encode(const drawn_signature_t& o, ::scale::Encoder& encoder);
void decode(drawn_signature_t& o, ::scale::Decoder& decoder);
void encode(const typed_text_t& o, ::scale::Encoder& encoder);
void decode(typed_text_t& o, ::scale::Decoder& decoder);
void encode(const date_value_t& o, ::scale::Encoder& encoder);
void decode(date_value_t& o, ::scale::Decoder& decoder);
void encode(const checkbox_value_t& o, ::scale::Encoder& encoder);
void decode(checkbox_value_t& o, ::scale::Decoder& decoder);

}  // namespace cosign::schema
