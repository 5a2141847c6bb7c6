#pragma once
#include <cosign/schema/field.hpp>
#include <cosign/schema/primitives.hpp>
#include <cosign/schema/recipient.hpp>
#include <cosign/schema/session_status.hpp>
#include <cosign/schema/signing_mode.hpp>
#include <optional>
#include <string>
#include <vector>

// Schema type: session.
// One document awaiting signatures from its recipients.
namespace cosign::schema {

template <uint16_t Version>
struct session;

template <>
struct session<1> final {
  uint16_t version{1};
  session_id_t id;
  std::string document_name;
  std::string created_by;
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t updated_at{};
  std::optional<timestamp_milliseconds_t> expires_at;
  std::optional<std::string> sender_email;
  session_status_t status{session_status_t::active};
  signing_mode_t signing_mode{signing_mode_t::parallel};
  std::vector<recipient_t> recipients;
  std::vector<field_t> fields;
  std::optional<bytes_t> timestamp_token;
};

using session_t = session<1>;

inline bool is_terminal(const session_status_t status) {
  return status != session_status_t::active;
}

}  // namespace cosign::schema
