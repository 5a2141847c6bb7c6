#pragma once

#include <cosign/schema/audit_event.hpp>
#include <cosign/schema/encoding/encoder.hpp>
#include <cosign/schema/encoding/scale/encoder.hpp>
#include <cosign/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Tamper-evident audit log. Each event commits to the one before it, so
// editing, dropping or reordering any event breaks every later link.
namespace cosign::session {

/// BLAKE3 over the SCALE encoding of the event with `hash` zeroed.
cosign::schema::hash32_t compute_event_hash(
    cosign::schema::encoding::encoder<
        cosign::schema::encoding::scale_encoder_tag>& encoder,
    const cosign::schema::audit_event_t& event);

/// Next event of the session chain. `previous` is the last persisted event
/// of the same session, if any.
cosign::schema::audit_event_t make_audit_event(
    cosign::schema::encoding::encoder<
        cosign::schema::encoding::scale_encoder_tag>& encoder,
    const std::optional<cosign::schema::audit_event_t>& previous,
    const cosign::schema::session_id_t& session_id,
    const cosign::schema::recipient_id_t& recipient_id,
    cosign::schema::audit_action_t action,
    cosign::schema::timestamp_milliseconds_t recorded_at,
    std::string details = {});

/// Sequence of the first event that does not verify, or std::nullopt when
/// the whole chain is intact.
std::optional<uint64_t> verify_chain(
    cosign::schema::encoding::encoder<
        cosign::schema::encoding::scale_encoder_tag>& encoder,
    const std::vector<cosign::schema::audit_event_t>& events);

}  // namespace cosign::session
