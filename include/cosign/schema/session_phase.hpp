#pragma once

#include <cosign/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: per-recipient phase of a loaded session.
namespace cosign::schema {

enum class session_phase_t : uint8_t {
  loading = 0,
  consent_pending = 1,
  signing_active = 2,
  completed = 3,
  declined = 4,
  expired = 5
};

inline constexpr auto kSessionPhaseMappings = std::array{
    std::pair<std::string_view, session_phase_t>{"loading", session_phase_t::loading},
    std::pair<std::string_view, session_phase_t>{"consent_pending", session_phase_t::consent_pending},
    std::pair<std::string_view, session_phase_t>{"signing_active", session_phase_t::signing_active},
    std::pair<std::string_view, session_phase_t>{"completed", session_phase_t::completed},
    std::pair<std::string_view, session_phase_t>{"declined", session_phase_t::declined},
    std::pair<std::string_view, session_phase_t>{"expired", session_phase_t::expired}};

template <>
inline std::optional<session_phase_t> try_from_string<session_phase_t>(
    const std::string_view value) {
  return lookup_enum(value, kSessionPhaseMappings);
}

inline constexpr std::string_view to_string(const session_phase_t value) {
  return name_of(value, kSessionPhaseMappings);
}

}  // namespace cosign::schema
