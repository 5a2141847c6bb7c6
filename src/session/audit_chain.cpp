#include <cosign/blake3/hash.hpp>
#include <cosign/session/audit_chain.hpp>
#include <utility>

namespace cosign::session {

cosign::schema::hash32_t compute_event_hash(
    cosign::schema::encoding::encoder<
        cosign::schema::encoding::scale_encoder_tag>& encoder,
    const cosign::schema::audit_event_t& event) {
  auto unsealed = event;
  unsealed.hash = cosign::schema::make_zero_hash();
  auto encoded = encoder.encode(unsealed);
  return cosign::blake3::hash(cosign::schema::make_bytes_view(encoded));
}

cosign::schema::audit_event_t make_audit_event(
    cosign::schema::encoding::encoder<
        cosign::schema::encoding::scale_encoder_tag>& encoder,
    const std::optional<cosign::schema::audit_event_t>& previous,
    const cosign::schema::session_id_t& session_id,
    const cosign::schema::recipient_id_t& recipient_id,
    cosign::schema::audit_action_t action,
    cosign::schema::timestamp_milliseconds_t recorded_at,
    std::string details) {
  auto event = cosign::schema::audit_event_t{};
  event.sequence = previous.has_value() ? previous->sequence + 1 : 0;
  event.session_id = session_id;
  event.recipient_id = recipient_id;
  event.action = action;
  event.recorded_at = recorded_at;
  event.details = std::move(details);
  event.previous_hash = previous.has_value() ? previous->hash
                                             : cosign::schema::make_zero_hash();
  event.hash = compute_event_hash(encoder, event);
  return event;
}

std::optional<uint64_t> verify_chain(
    cosign::schema::encoding::encoder<
        cosign::schema::encoding::scale_encoder_tag>& encoder,
    const std::vector<cosign::schema::audit_event_t>& events) {
  auto expected_previous = cosign::schema::make_zero_hash();
  auto expected_sequence = uint64_t{0};
  for (const auto& event : events) {
    if (event.sequence != expected_sequence ||
        event.previous_hash != expected_previous ||
        event.hash != compute_event_hash(encoder, event)) {
      return event.sequence;
    }
    expected_previous = event.hash;
    ++expected_sequence;
  }
  return std::nullopt;
}

}  // namespace cosign::session
