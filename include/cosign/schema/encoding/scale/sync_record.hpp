#pragma once
#include <cosign/schema/sync_record.hpp>
#include <cosign/schema/encoding/scale/signed_submission.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace cosign::schema {

void encode(const sync_record<1>& o, ::scale::Encoder& encoder);
void decode(sync_record<1>& o, ::scale::Decoder& decoder);

}  // namespace cosign::schema
