#pragma once
#include <cosign/schema/primitives.hpp>
#include <string>

namespace cosign::schema {

// What a recipient's signing link carries.
struct session_credentials_t final {
  session_id_t session_id;
  recipient_id_t recipient_id;
  std::string signing_key;
};

}  // namespace cosign::schema
