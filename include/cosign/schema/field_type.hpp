#pragma once

#include <cosign/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: field type.
namespace cosign::schema {

enum class field_type_t : uint8_t {
  signature = 0,
  initials = 1,
  text = 2,
  date = 3,
  checkbox = 4
};

inline constexpr auto kFieldTypeMappings = std::array{
    std::pair<std::string_view, field_type_t>{"signature", field_type_t::signature},
    std::pair<std::string_view, field_type_t>{"initials", field_type_t::initials},
    std::pair<std::string_view, field_type_t>{"text", field_type_t::text},
    std::pair<std::string_view, field_type_t>{"date", field_type_t::date},
    std::pair<std::string_view, field_type_t>{"checkbox", field_type_t::checkbox}};

template <>
inline std::optional<field_type_t> try_from_string<field_type_t>(
    const std::string_view value) {
  return lookup_enum(value, kFieldTypeMappings);
}

inline constexpr std::string_view to_string(const field_type_t value) {
  return name_of(value, kFieldTypeMappings);
}

}  // namespace cosign::schema
