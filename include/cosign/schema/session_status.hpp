#pragma once

#include <cosign/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: session status.
// Monotonic: active may move to any terminal value, terminal values never
// change again.
namespace cosign::schema {

enum class session_status_t : uint8_t {
  active = 0,
  expired = 1,
  declined = 2,
  completed = 3
};

inline constexpr auto kSessionStatusMappings = std::array{
    std::pair<std::string_view, session_status_t>{"active", session_status_t::active},
    std::pair<std::string_view, session_status_t>{"expired", session_status_t::expired},
    std::pair<std::string_view, session_status_t>{"declined", session_status_t::declined},
    std::pair<std::string_view, session_status_t>{"completed", session_status_t::completed}};

template <>
inline std::optional<session_status_t> try_from_string<session_status_t>(
    const std::string_view value) {
  return lookup_enum(value, kSessionStatusMappings);
}

inline constexpr std::string_view to_string(const session_status_t value) {
  return name_of(value, kSessionStatusMappings);
}

}  // namespace cosign::schema
