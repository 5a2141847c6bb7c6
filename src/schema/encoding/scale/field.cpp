#include <cosign/schema/encoding/scale/field.hpp>

namespace cosign::schema {

void encode(const field_rect_t& o, ::scale::Encoder& encoder) {
  encode(o.x, encoder);
  encode(o.y, encoder);
  encode(o.width, encoder);
  encode(o.height, encoder);
}

void decode(field_rect_t& o, ::scale::Decoder& decoder) {
  decode(o.x, decoder);
  decode(o.y, decoder);
  decode(o.width, decoder);
  decode(o.height, decoder);
}

void encode(const field<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.type, encoder);
  encode(o.page, encoder);
  encode(o.rect, encoder);
  encode(o.recipient_id, encoder);
  encode(o.required, encoder);
  encode(o.completed, encoder);
  encode(o.value, encoder);
  encode(o.completed_at, encoder);
}

void decode(field<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.type, decoder);
  decode(o.page, decoder);
  decode(o.rect, decoder);
  decode(o.recipient_id, decoder);
  decode(o.required, decoder);
  decode(o.completed, decoder);
  decode(o.value, decoder);
  decode(o.completed_at, decoder);
}

}  // namespace cosign::schema
