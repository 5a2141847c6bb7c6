#include <cosign/schema/encoding/scale/cached_session.hpp>

namespace cosign::schema {

void encode(const cached_session<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.session, encoder);
  encode(o.recipient_id, encoder);
  encode(o.sync_state, encoder);
  encode(o.cached_at, encoder);
  encode(o.last_synced_at, encoder);
}

void decode(cached_session<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.session, decoder);
  decode(o.recipient_id, decoder);
  decode(o.sync_state, decoder);
  decode(o.cached_at, decoder);
  decode(o.last_synced_at, decoder);
}

}  // namespace cosign::schema
