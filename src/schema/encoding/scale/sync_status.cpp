#include <cosign/schema/encoding/scale/sync_status.hpp>

namespace cosign::schema {

void encode(const sync_error_t& o, ::scale::Encoder& encoder) {
  encode(o.session_id, encoder);
  encode(o.recipient_id, encoder);
  encode(o.error, encoder);
  encode(o.attempt_count, encoder);
  encode(o.recorded_at, encoder);
}

void decode(sync_error_t& o, ::scale::Decoder& decoder) {
  decode(o.session_id, decoder);
  decode(o.recipient_id, decoder);
  decode(o.error, decoder);
  decode(o.attempt_count, decoder);
  decode(o.recorded_at, decoder);
}

void encode(const sync_status<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.pending_count, encoder);
  encode(o.last_attempt_at, encoder);
  encode(o.last_success_at, encoder);
  encode(o.syncing, encoder);
  encode(o.offline_mode, encoder);
  encode(o.errors, encoder);
}

void decode(sync_status<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.pending_count, decoder);
  decode(o.last_attempt_at, decoder);
  decode(o.last_success_at, decoder);
  decode(o.syncing, decoder);
  decode(o.offline_mode, decoder);
  decode(o.errors, decoder);
}

}  // namespace cosign::schema
