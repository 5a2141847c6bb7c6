#include <cosign/schema/encoding/scale/field_value.hpp>

namespace cosign::schema {

void encode(const drawn_signature_t& o, ::scale::Encoder& encoder) {
  encode(o.image_ref, encoder);
}

void decode(drawn_signature_t& o, ::scale::Decoder& decoder) {
  decode(o.image_ref, decoder);
}

void encode(const typed_text_t& o, ::scale::Encoder& encoder) {
  encode(o.text, encoder);
  encode(o.font, encoder);
}

void decode(typed_text_t& o, ::scale::Decoder& decoder) {
  decode(o.text, decoder);
  decode(o.font, decoder);
}

void encode(const date_value_t& o, ::scale::Encoder& encoder) {
  encode(o.date, encoder);
}

void decode(date_value_t& o, ::scale::Decoder& decoder) {
  decode(o.date, decoder);
}

void encode(const checkbox_value_t& o, ::scale::Encoder& encoder) {
  encode(o.checked, encoder);
}

void decode(checkbox_value_t& o, ::scale::Decoder& decoder) {
  decode(o.checked, decoder);
}

}  // namespace cosign::schema
