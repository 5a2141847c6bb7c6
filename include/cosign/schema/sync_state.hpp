#pragma once

#include <cosign/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: sync state of a cached session.
// local -> queued -> syncing -> {synced, queued}.
namespace cosign::schema {

enum class sync_state_t : uint8_t {
  local = 0,
  queued = 1,
  syncing = 2,
  synced = 3
};

inline constexpr auto kSyncStateMappings = std::array{
    std::pair<std::string_view, sync_state_t>{"local", sync_state_t::local},
    std::pair<std::string_view, sync_state_t>{"queued", sync_state_t::queued},
    std::pair<std::string_view, sync_state_t>{"syncing", sync_state_t::syncing},
    std::pair<std::string_view, sync_state_t>{"synced", sync_state_t::synced}};

template <>
inline std::optional<sync_state_t> try_from_string<sync_state_t>(
    const std::string_view value) {
  return lookup_enum(value, kSyncStateMappings);
}

inline constexpr std::string_view to_string(const sync_state_t value) {
  return name_of(value, kSyncStateMappings);
}

}  // namespace cosign::schema
