#pragma once

#include <cosign/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: recipient role. Only signers take part in ordering.
namespace cosign::schema {

enum class recipient_role_t : uint8_t {
  signer = 0,
  reviewer = 1,
  cc = 2
};

inline constexpr auto kRecipientRoleMappings = std::array{
    std::pair<std::string_view, recipient_role_t>{"signer", recipient_role_t::signer},
    std::pair<std::string_view, recipient_role_t>{"reviewer", recipient_role_t::reviewer},
    std::pair<std::string_view, recipient_role_t>{"cc", recipient_role_t::cc}};

template <>
inline std::optional<recipient_role_t> try_from_string<recipient_role_t>(
    const std::string_view value) {
  return lookup_enum(value, kRecipientRoleMappings);
}

inline constexpr std::string_view to_string(const recipient_role_t value) {
  return name_of(value, kRecipientRoleMappings);
}

}  // namespace cosign::schema
