#include <algorithm>
#include <cosign/schema/key/builder.hpp>
#include <cosign/schema/key/engine_keys.hpp>

namespace cosign::schema::key {

namespace {

bytes_t make_pair_key(std::string_view prefix,
                      std::string_view session_id,
                      std::string_view recipient_id) {
  auto b = builder{};
  b.write(prefix).component(session_id).write(recipient_id);
  return b.data;
}

}  // namespace

bytes_t make_session_key(std::string_view session_id,
                         std::string_view recipient_id) {
  return make_pair_key(kSessionPrefix, session_id, recipient_id);
}

bytes_t make_queue_key(std::string_view session_id,
                       std::string_view recipient_id) {
  return make_pair_key(kQueuePrefix, session_id, recipient_id);
}

bytes_t make_queue_prefix() {
  return make_bytes(kQueuePrefix);
}

bytes_t make_signatures_key(std::string_view session_id,
                            std::string_view recipient_id) {
  return make_pair_key(kSignaturesPrefix, session_id, recipient_id);
}

bytes_t make_audit_key(std::string_view session_id, uint64_t sequence) {
  auto b = builder{};
  b.write(kAuditPrefix).component(session_id).write(sequence);
  return b.data;
}

bytes_t make_audit_prefix(std::string_view session_id) {
  auto b = builder{};
  b.write(kAuditPrefix).component(session_id);
  return b.data;
}

bytes_t make_sync_status_key() {
  return make_bytes(kSyncStatusKey);
}

bytes_t make_sync_generation_key() {
  return make_bytes(kSyncGenerationKey);
}

std::optional<uint64_t> parse_audit_key(std::string_view session_id,
                                        const bytes_view_t& key) {
  auto prefix = make_audit_prefix(session_id);
  if (key.size() != prefix.size() + sizeof(uint64_t) ||
      !std::equal(std::begin(prefix), std::end(prefix), std::begin(key))) {
    return std::nullopt;
  }
  auto sequence = uint64_t{0};
  for (auto i = prefix.size(); i < key.size(); ++i) {
    sequence = (sequence << 8u) | key[i];
  }
  return sequence;
}

}  // namespace cosign::schema::key
