#include <cosign/schema/encoding/scale/recipient.hpp>

namespace cosign::schema {

void encode(const recipient<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.name, encoder);
  encode(o.email, encoder);
  encode(o.role, encoder);
  encode(o.order, encoder);
  encode(o.consent_at, encoder);
  encode(o.consent_text_hash, encoder);
  encode(o.consent_user_agent, encoder);
  encode(o.finished_at, encoder);
  encode(o.declined_at, encoder);
  encode(o.decline_reason, encoder);
}

void decode(recipient<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.name, decoder);
  decode(o.email, decoder);
  decode(o.role, decoder);
  decode(o.order, decoder);
  decode(o.consent_at, decoder);
  decode(o.consent_text_hash, decoder);
  decode(o.consent_user_agent, decoder);
  decode(o.finished_at, decoder);
  decode(o.declined_at, decoder);
  decode(o.decline_reason, decoder);
}

}  // namespace cosign::schema
