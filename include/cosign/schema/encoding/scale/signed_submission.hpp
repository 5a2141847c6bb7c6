#pragma once
#include <cosign/schema/signed_submission.hpp>
#include <cosign/schema/encoding/scale/field_value.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace cosign::schema {

void encode(const field_signature_t& o, ::scale::Encoder& encoder);
void decode(field_signature_t& o, ::scale::Decoder& decoder);
void encode(const consent_submission_t& o, ::scale::Encoder& encoder);
void decode(consent_submission_t& o, ::scale::Decoder& decoder);
void encode(const decline_submission_t& o, ::scale::Encoder& encoder);
void decode(decline_submission_t& o, ::scale::Decoder& decoder);
void encode(const signed_submission<1>& o, ::scale::Encoder& encoder);
void decode(signed_submission<1>& o, ::scale::Decoder& decoder);

}  // namespace cosign::schema
