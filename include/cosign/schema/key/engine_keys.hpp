#pragma once

#include <array>
#include <cosign/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema key type: local store keys.
// Every record the sync engine persists lives under one of these prefixes.
// Session and recipient ids are validated to never contain the separator.
namespace cosign::schema::key {

inline constexpr std::string_view kSessionPrefix{"SESSION|"};
inline constexpr std::string_view kQueuePrefix{"QUEUE|"};
inline constexpr std::string_view kSignaturesPrefix{"SIGS|"};
inline constexpr std::string_view kAuditPrefix{"AUDIT|"};
inline constexpr std::string_view kSyncStatusKey{"SYS|SYNC|STATUS"};
inline constexpr std::string_view kSyncGenerationKey{"SYS|SYNC|GENERATION"};

inline constexpr std::array<std::string_view, 6> kStoreKeyspaces{
    kSessionPrefix,     kQueuePrefix,  kSignaturesPrefix,
    kAuditPrefix,       kSyncStatusKey, kSyncGenerationKey};

bytes_t make_session_key(std::string_view session_id,
                         std::string_view recipient_id);
bytes_t make_queue_key(std::string_view session_id,
                       std::string_view recipient_id);
bytes_t make_queue_prefix();
bytes_t make_signatures_key(std::string_view session_id,
                            std::string_view recipient_id);
bytes_t make_audit_key(std::string_view session_id, uint64_t sequence);
bytes_t make_audit_prefix(std::string_view session_id);
bytes_t make_sync_status_key();
bytes_t make_sync_generation_key();

// Returns the sequence of an audit key, or std::nullopt if the key is not an
// audit key for the session.
std::optional<uint64_t> parse_audit_key(std::string_view session_id,
                                        const bytes_view_t& key);

}  // namespace cosign::schema::key
