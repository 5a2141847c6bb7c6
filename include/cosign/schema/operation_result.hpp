#pragma once

#include <cosign/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace cosign::schema {

template <uint16_t Version>
struct operation_result;

// Outcome of a state machine mutation. `code` is zero on success, otherwise
// a session_error_code value.
template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  // First incomplete required field, set on incomplete_required_fields.
  std::optional<field_id_t> field_id;
};

using operation_result_t = operation_result<1>;

}  // namespace cosign::schema
