#pragma once
#include <cosign/schema/primitives.hpp>
#include <cosign/schema/session.hpp>
#include <cosign/schema/sync_state.hpp>
#include <optional>

// Schema type: cached session.
// Local durable copy of a session as seen by one recipient.
namespace cosign::schema {

template <uint16_t Version>
struct cached_session;

template <>
struct cached_session<1> final {
  uint16_t version{1};
  session_t session;
  recipient_id_t recipient_id;
  sync_state_t sync_state{sync_state_t::local};
  timestamp_milliseconds_t cached_at{};
  std::optional<timestamp_milliseconds_t> last_synced_at;
};

using cached_session_t = cached_session<1>;

}  // namespace cosign::schema
