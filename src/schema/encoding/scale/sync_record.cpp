#include <cosign/schema/encoding/scale/sync_record.hpp>

namespace cosign::schema {

void encode(const sync_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.session_id, encoder);
  encode(o.recipient_id, encoder);
  encode(o.payload, encoder);
  encode(o.attempt_count, encoder);
  encode(o.enqueued_at, encoder);
  encode(o.generation, encoder);
  encode(o.next_attempt_at, encoder);
  encode(o.consent_synced, encoder);
  encode(o.last_error, encoder);
}

void decode(sync_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.session_id, decoder);
  decode(o.recipient_id, decoder);
  decode(o.payload, decoder);
  decode(o.attempt_count, decoder);
  decode(o.enqueued_at, decoder);
  decode(o.generation, decoder);
  decode(o.next_attempt_at, decoder);
  decode(o.consent_synced, decoder);
  decode(o.last_error, decoder);
}

}  // namespace cosign::schema
