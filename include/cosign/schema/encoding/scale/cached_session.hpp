#pragma once
#include <cosign/schema/cached_session.hpp>
#include <cosign/schema/encoding/scale/session.hpp>
#include <cosign/schema/encoding/scale/sync_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace cosign::schema {

void encode(const cached_session<1>& o, ::scale::Encoder& encoder);
void decode(cached_session<1>& o, ::scale::Decoder& decoder);

}  // namespace cosign::schema
