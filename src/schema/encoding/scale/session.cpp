#include <cosign/schema/encoding/scale/session.hpp>

namespace cosign::schema {

void encode(const session<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.document_name, encoder);
  encode(o.created_by, encoder);
  encode(o.created_at, encoder);
  encode(o.updated_at, encoder);
  encode(o.expires_at, encoder);
  encode(o.sender_email, encoder);
  encode(o.status, encoder);
  encode(o.signing_mode, encoder);
  encode(o.recipients, encoder);
  encode(o.fields, encoder);
  encode(o.timestamp_token, encoder);
}

void decode(session<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.document_name, decoder);
  decode(o.created_by, decoder);
  decode(o.created_at, decoder);
  decode(o.updated_at, decoder);
  decode(o.expires_at, decoder);
  decode(o.sender_email, decoder);
  decode(o.status, decoder);
  decode(o.signing_mode, decoder);
  decode(o.recipients, decoder);
  decode(o.fields, decoder);
  decode(o.timestamp_token, decoder);
}

}  // namespace cosign::schema
