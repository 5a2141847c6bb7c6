#pragma once
#include <cosign/schema/primitives.hpp>
#include <optional>
#include <string>
#include <vector>

// Schema type: sync status.
// Summary of the outbound queue, persisted so it survives restarts.
namespace cosign::schema {

struct sync_error_t final {
  session_id_t session_id;
  recipient_id_t recipient_id;
  std::string error;
  uint32_t attempt_count{};
  timestamp_milliseconds_t recorded_at{};
};

template <uint16_t Version>
struct sync_status;

template <>
struct sync_status<1> final {
  uint16_t version{1};
  uint32_t pending_count{};
  std::optional<timestamp_milliseconds_t> last_attempt_at;
  std::optional<timestamp_milliseconds_t> last_success_at;
  bool syncing{};
  bool offline_mode{};
  std::vector<sync_error_t> errors;
};

using sync_status_t = sync_status<1>;

}  // namespace cosign::schema
