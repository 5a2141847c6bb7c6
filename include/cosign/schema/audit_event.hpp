#pragma once
#include <cosign/schema/audit_action.hpp>
#include <cosign/schema/primitives.hpp>
#include <string>

// Schema type: audit event.
// `hash` covers every other field, `previous_hash` links to the prior event
// of the same session (zero hash for the first).
namespace cosign::schema {

template <uint16_t Version>
struct audit_event;

template <>
struct audit_event<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  session_id_t session_id;
  recipient_id_t recipient_id;
  audit_action_t action{audit_action_t::session_loaded};
  timestamp_milliseconds_t recorded_at{};
  std::string details;
  hash32_t previous_hash{};
  hash32_t hash{};
};

using audit_event_t = audit_event<1>;

}  // namespace cosign::schema
