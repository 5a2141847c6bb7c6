#pragma once
#include <cosign/schema/sync_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace cosign::schema {

void encode(const sync_state_t& o, ::scale::Encoder& encoder);
void decode(sync_state_t& o, ::scale::Decoder& decoder);

}  // namespace cosign::schema
