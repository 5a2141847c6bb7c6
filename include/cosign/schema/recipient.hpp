#pragma once
#include <cosign/schema/primitives.hpp>
#include <cosign/schema/recipient_role.hpp>
#include <optional>
#include <string>

// Schema type: recipient.
// Consent fields are written once and never cleared. finished_at seals the
// recipient's contribution.
namespace cosign::schema {

template <uint16_t Version>
struct recipient;

template <>
struct recipient<1> final {
  uint16_t version{1};
  recipient_id_t id;
  std::string name;
  std::string email;
  recipient_role_t role{recipient_role_t::signer};
  uint32_t order{};
  std::optional<timestamp_milliseconds_t> consent_at;
  std::optional<hash32_t> consent_text_hash;
  std::optional<std::string> consent_user_agent;
  std::optional<timestamp_milliseconds_t> finished_at;
  std::optional<timestamp_milliseconds_t> declined_at;
  std::optional<std::string> decline_reason;
};

using recipient_t = recipient<1>;

}  // namespace cosign::schema
