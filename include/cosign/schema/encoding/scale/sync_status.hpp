#pragma once
#include <cosign/schema/sync_status.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace cosign::schema {

void encode(const sync_error_t& o, ::scale::Encoder& encoder);
void decode(sync_error_t& o, ::scale::Decoder& decoder);
void encode(const sync_status<1>& o, ::scale::Encoder& encoder);
void decode(sync_status<1>& o, ::scale::Decoder& decoder);

}  // namespace cosign::schema
