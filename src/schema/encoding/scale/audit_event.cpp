#include <cosign/schema/encoding/scale/audit_event.hpp>

namespace cosign::schema {

void encode(const audit_event<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.sequence, encoder);
  encode(o.session_id, encoder);
  encode(o.recipient_id, encoder);
  encode(o.action, encoder);
  encode(o.recorded_at, encoder);
  encode(o.details, encoder);
  encode(o.previous_hash, encoder);
  encode(o.hash, encoder);
}

void decode(audit_event<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.sequence, decoder);
  decode(o.session_id, decoder);
  decode(o.recipient_id, decoder);
  decode(o.action, decoder);
  decode(o.recorded_at, decoder);
  decode(o.details, decoder);
  decode(o.previous_hash, decoder);
  decode(o.hash, decoder);
}

}  // namespace cosign::schema
