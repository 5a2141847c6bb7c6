#include <cosign/schema/encoding/scale/audit_action.hpp>
#include <cosign/schema/encoding/scale/field_type.hpp>
#include <cosign/schema/encoding/scale/recipient_role.hpp>
#include <cosign/schema/encoding/scale/session_status.hpp>
#include <cosign/schema/encoding/scale/signing_mode.hpp>
#include <cosign/schema/encoding/scale/sync_state.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace cosign::schema {

namespace {

template <typename Enum>
void encode_enum(const Enum value, ::scale::Encoder& encoder) {
  encode(static_cast<uint8_t>(value), encoder);
}

template <typename Enum>
void decode_enum(Enum& value, const Enum last, ::scale::Decoder& decoder) {
  auto raw = uint8_t{};
  decode(raw, decoder);
  if (raw > static_cast<uint8_t>(last)) {
    throw std::out_of_range{"enum value out of range: " + std::to_string(raw)};
  }
  value = static_cast<Enum>(raw);
}

}  // namespace

void encode(const session_status_t& o, ::scale::Encoder& encoder) {
  encode_enum(o, encoder);
}

void decode(session_status_t& o, ::scale::Decoder& decoder) {
  decode_enum(o, session_status_t::completed, decoder);
}

void encode(const signing_mode_t& o, ::scale::Encoder& encoder) {
  encode_enum(o, encoder);
}

void decode(signing_mode_t& o, ::scale::Decoder& decoder) {
  decode_enum(o, signing_mode_t::parallel, decoder);
}

void encode(const recipient_role_t& o, ::scale::Encoder& encoder) {
  encode_enum(o, encoder);
}

void decode(recipient_role_t& o, ::scale::Decoder& decoder) {
  decode_enum(o, recipient_role_t::cc, decoder);
}

void encode(const field_type_t& o, ::scale::Encoder& encoder) {
  encode_enum(o, encoder);
}

void decode(field_type_t& o, ::scale::Decoder& decoder) {
  decode_enum(o, field_type_t::checkbox, decoder);
}

void encode(const sync_state_t& o, ::scale::Encoder& encoder) {
  encode_enum(o, encoder);
}

void decode(sync_state_t& o, ::scale::Decoder& decoder) {
  decode_enum(o, sync_state_t::synced, decoder);
}

void encode(const audit_action_t& o, ::scale::Encoder& encoder) {
  encode_enum(o, encoder);
}

void decode(audit_action_t& o, ::scale::Decoder& decoder) {
  decode_enum(o, audit_action_t::timestamp_attached, decoder);
}

}  // namespace cosign::schema
