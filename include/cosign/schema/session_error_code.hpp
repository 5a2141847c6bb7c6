#pragma once

#include <cstdint>
#include <string_view>

namespace cosign::schema {

// Codes 1-9 reject the request itself, 10-19 are lifecycle and ordering
// violations, 20-29 come from the remote authority, 30+ from timestamping.
enum class session_error_code : uint32_t {
  validation_error = 1,
  not_found = 2,
  expired = 3,
  invalid_credentials = 4,
  invalid_transition = 10,
  ordering_violation = 11,
  invalid_field = 12,
  incomplete_required_fields = 13,
  network_error = 20,
  conflict = 21,
  timestamp_error = 30
};

inline constexpr std::string_view kSessionCodespace{"cosign.session"};
inline constexpr std::string_view kSyncCodespace{"cosign.sync"};
inline constexpr std::string_view kTimestampCodespace{"cosign.timestamp"};

}  // namespace cosign::schema
