#pragma once

#include <cosign/common/time_source.hpp>
#include <cosign/schema/audit_event.hpp>
#include <cosign/schema/cached_session.hpp>
#include <cosign/schema/encoding/encoder.hpp>
#include <cosign/schema/primitives.hpp>
#include <cosign/schema/session.hpp>
#include <cosign/schema/session_credentials.hpp>
#include <cosign/schema/signed_submission.hpp>
#include <cosign/schema/sync_record.hpp>
#include <cosign/schema/sync_status.hpp>
#include <cosign/storage/rocksdb/storage.hpp>
#include <cosign/sync/remote_authority.hpp>
#include <cstdint>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cosign::sync {

using encoder_t = cosign::schema::encoding::encoder<
    cosign::schema::encoding::scale_encoder_tag>;
using storage_t =
    cosign::storage::storage<cosign::storage::rocksdb_storage_tag>;

struct sync_config_t final {
  cosign::schema::duration_milliseconds_t min_backoff{1000};
  cosign::schema::duration_milliseconds_t max_backoff{30000};
  /// Records that failed this many times stay queued but are not retried
  /// automatically.
  uint32_t max_retries{10};
  /// Period between background drains while online.
  cosign::schema::duration_milliseconds_t retry_interval{30000};
};

enum class cache_outcome_t : uint8_t { stored = 0, kept_existing = 1 };

enum class record_outcome_t : uint8_t {
  /// Accepted remotely; record removed.
  synced = 0,
  /// Remote already completed the session; record discarded.
  redundant = 1,
  /// Definitive rejection; record dropped.
  conflict = 2,
  /// Transient failure; record kept with a later next_attempt_at.
  retry_scheduled = 3,
  /// A newer record replaced this one while it was in flight.
  superseded = 4,
  /// Not yet due.
  deferred = 5,
  /// Exhausted max_retries.
  stalled = 6
};

struct record_report_t final {
  cosign::schema::session_id_t session_id;
  cosign::schema::recipient_id_t recipient_id;
  record_outcome_t outcome{record_outcome_t::synced};
  std::optional<remote_status_t> remote_status;
  std::string detail;
};

struct sync_report_t final {
  /// False when the drain did not run (offline, or already running).
  bool attempted{};
  std::vector<record_report_t> records;
};

/// Result of resolving a session locally first, then remotely.
struct fetch_result_t final {
  /// Zero on success, otherwise a session_error_code.
  uint32_t code{};
  std::optional<cosign::schema::cached_session_t> cached;
  std::string log;
};

/// Local-first persistence and reconciliation.
///
/// The engine is the only component that touches the local store and the
/// only one that talks to the remote authority. Local writes are durable
/// when the call returns. Remote calls run outside the store lock so a slow
/// network never blocks local commits.
class engine final {
 public:
  engine(encoder_t& encoder,
         storage_t& storage,
         remote_authority& remote,
         cosign::common::time_source_t clock,
         sync_config_t config = {});

  /// Upsert a snapshot received from the remote authority.
  ///
  /// Last write wins on `updated_at`, except that an active snapshot never
  /// replaces a terminal cached status, and a terminal snapshot always
  /// replaces an active one. Local progress of `recipient_id` that is still
  /// queued is carried into the stored copy.
  cache_outcome_t cache_session(const cosign::schema::session_t& snapshot,
                                std::string_view recipient_id);

  /// Persist a local commit of the state machine.
  void store_session(const cosign::schema::session_t& session,
                     std::string_view recipient_id);

  std::optional<cosign::schema::cached_session_t> load_session(
      std::string_view session_id,
      std::string_view recipient_id) const;

  /// Local cache first; on a miss, fetch from the authority and cache.
  fetch_result_t fetch_session(
      const cosign::schema::session_credentials_t& credentials);

  /// Durable write of a recipient's signatures. Always completes before any
  /// sync attempt that could carry them.
  void save_signatures(std::string_view session_id,
                       std::string_view recipient_id,
                       const cosign::schema::signed_submission_t& signatures);

  std::optional<cosign::schema::signed_submission_t> load_signatures(
      std::string_view session_id,
      std::string_view recipient_id) const;

  /// Queue an outbound record, replacing any unsent record for the same
  /// (session_id, recipient_id). Returns the record as stored.
  cosign::schema::sync_record_t queue_for_sync(
      cosign::schema::sync_record_t record);

  std::vector<cosign::schema::sync_record_t> pending() const;

  /// Drain every due record once. No-op while offline.
  sync_report_t sync();

  /// sync() on a background task.
  std::future<sync_report_t> sync_async();

  /// Ask the authority for a fresh link for an expired session.
  remote_response_t request_new_link(
      const cosign::schema::session_id_t& session_id,
      const cosign::schema::recipient_id_t& recipient_id);

  void append_audit(const cosign::schema::audit_event_t& event);
  std::vector<cosign::schema::audit_event_t> audit_trail(
      std::string_view session_id) const;
  std::optional<cosign::schema::audit_event_t> last_audit_event(
      std::string_view session_id) const;

  cosign::schema::sync_status_t status() const;

  /// User-selected offline mode; persisted.
  void set_offline_mode(bool offline);
  /// Connectivity as observed by the host; not persisted.
  void set_online(bool online);
  bool can_sync() const;

  /// min(min_backoff * 2^(attempt - 1), max_backoff)
  cosign::schema::duration_milliseconds_t backoff_delay(
      uint32_t attempt_count) const;

  const sync_config_t& config() const { return config_; }

 private:
  struct attempt_t final {
    record_outcome_t outcome{record_outcome_t::synced};
    std::optional<remote_status_t> remote_status;
    std::string detail;
    bool consent_synced{};
  };

  attempt_t submit(const cosign::schema::sync_record_t& record);
  void apply_attempt(const cosign::schema::sync_record_t& sent,
                     const attempt_t& attempt,
                     sync_report_t& report);

  std::optional<cosign::schema::sync_record_t> load_record(
      std::string_view session_id,
      std::string_view recipient_id) const;
  void write_sync_state(std::string_view session_id,
                        std::string_view recipient_id,
                        cosign::schema::sync_state_t state,
                        std::optional<cosign::schema::timestamp_milliseconds_t>
                            synced_at = std::nullopt);
  cosign::schema::sync_status_t load_status() const;
  void save_status(const cosign::schema::sync_status_t& status);
  void record_error(const cosign::schema::sync_record_t& record,
                    std::string error);
  void clear_error(std::string_view session_id, std::string_view recipient_id);
  /// Generation for the next queued record; persisted with the record.
  uint64_t next_generation() const;

  encoder_t& encoder_;
  storage_t& storage_;
  remote_authority& remote_;
  cosign::common::time_source_t clock_;
  sync_config_t config_;
  bool online_{true};
  bool syncing_{};
  mutable std::mutex mutex_;
};

}  // namespace cosign::sync
