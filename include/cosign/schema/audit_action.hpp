#pragma once

#include <cosign/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: audit action recorded in the per-session hash chain.
namespace cosign::schema {

enum class audit_action_t : uint8_t {
  session_created = 0,
  session_loaded = 1,
  consent_recorded = 2,
  field_completed = 3,
  field_reset = 4,
  recipient_finished = 5,
  recipient_declined = 6,
  session_completed = 7,
  session_declined = 8,
  session_expired = 9,
  link_requested = 10,
  timestamp_attached = 11
};

inline constexpr auto kAuditActionMappings = std::array{
    std::pair<std::string_view, audit_action_t>{"session_created", audit_action_t::session_created},
    std::pair<std::string_view, audit_action_t>{"session_loaded", audit_action_t::session_loaded},
    std::pair<std::string_view, audit_action_t>{"consent_recorded", audit_action_t::consent_recorded},
    std::pair<std::string_view, audit_action_t>{"field_completed", audit_action_t::field_completed},
    std::pair<std::string_view, audit_action_t>{"field_reset", audit_action_t::field_reset},
    std::pair<std::string_view, audit_action_t>{"recipient_finished", audit_action_t::recipient_finished},
    std::pair<std::string_view, audit_action_t>{"recipient_declined", audit_action_t::recipient_declined},
    std::pair<std::string_view, audit_action_t>{"session_completed", audit_action_t::session_completed},
    std::pair<std::string_view, audit_action_t>{"session_declined", audit_action_t::session_declined},
    std::pair<std::string_view, audit_action_t>{"session_expired", audit_action_t::session_expired},
    std::pair<std::string_view, audit_action_t>{"link_requested", audit_action_t::link_requested},
    std::pair<std::string_view, audit_action_t>{"timestamp_attached", audit_action_t::timestamp_attached}};

template <>
inline std::optional<audit_action_t> try_from_string<audit_action_t>(
    const std::string_view value) {
  return lookup_enum(value, kAuditActionMappings);
}

inline constexpr std::string_view to_string(const audit_action_t value) {
  return name_of(value, kAuditActionMappings);
}

}  // namespace cosign::schema
