#include <cosign/schema/encoding/scale/signed_submission.hpp>

namespace cosign::schema {

void encode(const field_signature_t& o, ::scale::Encoder& encoder) {
  encode(o.field_id, encoder);
  encode(o.value, encoder);
  encode(o.completed_at, encoder);
}

void decode(field_signature_t& o, ::scale::Decoder& decoder) {
  decode(o.field_id, decoder);
  decode(o.value, decoder);
  decode(o.completed_at, decoder);
}

void encode(const consent_submission_t& o, ::scale::Encoder& encoder) {
  encode(o.consent_text_hash, encoder);
  encode(o.user_agent, encoder);
  encode(o.consent_at, encoder);
}

void decode(consent_submission_t& o, ::scale::Decoder& decoder) {
  decode(o.consent_text_hash, decoder);
  decode(o.user_agent, decoder);
  decode(o.consent_at, decoder);
}

void encode(const decline_submission_t& o, ::scale::Encoder& encoder) {
  encode(o.reason, encoder);
  encode(o.declined_at, encoder);
}

void decode(decline_submission_t& o, ::scale::Decoder& decoder) {
  decode(o.reason, decoder);
  decode(o.declined_at, decoder);
}

void encode(const signed_submission<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.consent, encoder);
  encode(o.decline, encoder);
  encode(o.signatures, encoder);
  encode(o.completed_at, encoder);
}

void decode(signed_submission<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.consent, decoder);
  decode(o.decline, decoder);
  decode(o.signatures, decoder);
  decode(o.completed_at, decoder);
}

}  // namespace cosign::schema
