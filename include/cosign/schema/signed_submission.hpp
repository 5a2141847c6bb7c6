#pragma once
#include <cosign/schema/field_value.hpp>
#include <cosign/schema/primitives.hpp>
#include <optional>
#include <string>
#include <vector>

// Schema type: signed submission.
// Cumulative outbound state of one recipient. A later submission for the same
// recipient always contains everything an earlier one did.
namespace cosign::schema {

struct field_signature_t final {
  field_id_t field_id;
  field_value_t value;
  timestamp_milliseconds_t completed_at{};
};

struct consent_submission_t final {
  hash32_t consent_text_hash{};
  std::string user_agent;
  timestamp_milliseconds_t consent_at{};
};

struct decline_submission_t final {
  std::optional<std::string> reason;
  timestamp_milliseconds_t declined_at{};
};

template <uint16_t Version>
struct signed_submission;

template <>
struct signed_submission<1> final {
  uint16_t version{1};
  std::optional<consent_submission_t> consent;
  std::optional<decline_submission_t> decline;
  std::vector<field_signature_t> signatures;
  // Set when the recipient finished; signatures are sealed at that point.
  std::optional<timestamp_milliseconds_t> completed_at;
};

using signed_submission_t = signed_submission<1>;

}  // namespace cosign::schema
