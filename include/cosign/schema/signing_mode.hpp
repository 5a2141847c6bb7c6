#pragma once

#include <cosign/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: signing mode, fixed when the session is created.
namespace cosign::schema {

enum class signing_mode_t : uint8_t {
  sequential = 0,
  parallel = 1
};

inline constexpr auto kSigningModeMappings = std::array{
    std::pair<std::string_view, signing_mode_t>{"sequential", signing_mode_t::sequential},
    std::pair<std::string_view, signing_mode_t>{"parallel", signing_mode_t::parallel}};

template <>
inline std::optional<signing_mode_t> try_from_string<signing_mode_t>(
    const std::string_view value) {
  return lookup_enum(value, kSigningModeMappings);
}

inline constexpr std::string_view to_string(const signing_mode_t value) {
  return name_of(value, kSigningModeMappings);
}

}  // namespace cosign::schema
