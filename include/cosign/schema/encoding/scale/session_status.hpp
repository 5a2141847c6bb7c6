#pragma once
#include <cosign/schema/session_status.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// SCALE codecs, found by argument-dependent lookup from ::scale.
namespace cosign::schema {

void encode(const session_status_t& o, ::scale::Encoder& encoder);
void decode(session_status_t& o, ::scale::Decoder& decoder);

}  // namespace cosign::schema
