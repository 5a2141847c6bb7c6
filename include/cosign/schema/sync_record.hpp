#pragma once
#include <cosign/schema/primitives.hpp>
#include <cosign/schema/signed_submission.hpp>
#include <optional>
#include <string>

// Schema type: sync record.
// One pending outbound submission per (session_id, recipient_id).
namespace cosign::schema {

template <uint16_t Version>
struct sync_record;

template <>
struct sync_record<1> final {
  uint16_t version{1};
  session_id_t session_id;
  recipient_id_t recipient_id;
  signed_submission_t payload;
  uint32_t attempt_count{};
  timestamp_milliseconds_t enqueued_at{};
  uint64_t generation{};
  timestamp_milliseconds_t next_attempt_at{};
  // Consent already accepted remotely; not resent on retry.
  bool consent_synced{};
  std::optional<std::string> last_error;
};

using sync_record_t = sync_record<1>;

}  // namespace cosign::schema
