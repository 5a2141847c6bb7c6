#include <spdlog/spdlog.h>
#include <algorithm>
#include <cosign/schema/key/engine_keys.hpp>
#include <cosign/schema/session_error_code.hpp>
#include <cosign/sync/engine.hpp>
#include <exception>
#include <utility>

namespace cosign::sync {

namespace {

using cosign::schema::session_error_code;

cosign::schema::bytes_view_t view(const cosign::schema::bytes_t& bytes) {
  return cosign::schema::make_bytes_view(bytes);
}

// Keep what the local recipient did but has not yet delivered.
void carry_local_progress(const cosign::schema::session_t& local,
                          std::string_view recipient_id,
                          cosign::schema::session_t& incoming) {
  auto local_recipient =
      std::ranges::find(local.recipients, recipient_id,
                        &cosign::schema::recipient_t::id);
  auto incoming_recipient =
      std::ranges::find(incoming.recipients, recipient_id,
                        &cosign::schema::recipient_t::id);
  if (local_recipient != std::end(local.recipients) &&
      incoming_recipient != std::end(incoming.recipients)) {
    if (!incoming_recipient->consent_at.has_value()) {
      incoming_recipient->consent_at = local_recipient->consent_at;
      incoming_recipient->consent_text_hash =
          local_recipient->consent_text_hash;
      incoming_recipient->consent_user_agent =
          local_recipient->consent_user_agent;
    }
    if (!incoming_recipient->finished_at.has_value()) {
      incoming_recipient->finished_at = local_recipient->finished_at;
    }
    if (!incoming_recipient->declined_at.has_value()) {
      incoming_recipient->declined_at = local_recipient->declined_at;
      incoming_recipient->decline_reason = local_recipient->decline_reason;
    }
  }

  for (auto& field : incoming.fields) {
    if (field.recipient_id != recipient_id || field.completed) {
      continue;
    }
    auto local_field = std::ranges::find(local.fields, field.id,
                                         &cosign::schema::field_t::id);
    if (local_field != std::end(local.fields) && local_field->completed &&
        local_field->recipient_id == field.recipient_id) {
      field = *local_field;
    }
  }
}

}  // namespace

engine::engine(encoder_t& encoder,
               storage_t& storage,
               remote_authority& remote,
               cosign::common::time_source_t clock,
               sync_config_t config)
    : encoder_{encoder},
      storage_{storage},
      remote_{remote},
      clock_{std::move(clock)},
      config_{config} {}

cache_outcome_t engine::cache_session(const cosign::schema::session_t& snapshot,
                                      std::string_view recipient_id) {
  auto lock = std::scoped_lock{mutex_};
  auto key = cosign::schema::key::make_session_key(snapshot.id, recipient_id);
  auto existing = storage_.get<cosign::schema::cached_session_t>(
      encoder_, view(key));

  auto incoming = snapshot;
  auto state = cosign::schema::sync_state_t::synced;
  if (existing.has_value()) {
    const auto& cached = existing->session;
    auto cached_terminal = cosign::schema::is_terminal(cached.status);
    auto incoming_terminal = cosign::schema::is_terminal(incoming.status);
    if (cached_terminal && !incoming_terminal) {
      spdlog::info("Keeping cached {} status of session {} over active snapshot",
                   cosign::schema::to_string(cached.status), cached.id);
      return cache_outcome_t::kept_existing;
    }
    if (!(incoming_terminal && !cached_terminal) &&
        incoming.updated_at < cached.updated_at) {
      spdlog::debug("Ignoring stale snapshot of session {} ({} < {})",
                    incoming.id, incoming.updated_at, cached.updated_at);
      return cache_outcome_t::kept_existing;
    }
    if (load_record(snapshot.id, recipient_id).has_value()) {
      carry_local_progress(cached, recipient_id, incoming);
      state = cosign::schema::sync_state_t::queued;
    }
  }

  auto record = cosign::schema::cached_session_t{};
  record.session = std::move(incoming);
  record.recipient_id = std::string{recipient_id};
  record.sync_state = state;
  record.cached_at = clock_();
  record.last_synced_at = record.cached_at;
  storage_.put(encoder_, view(key), record);
  spdlog::debug("Cached session {} for recipient {}", snapshot.id,
                recipient_id);
  return cache_outcome_t::stored;
}

void engine::store_session(const cosign::schema::session_t& session,
                           std::string_view recipient_id) {
  auto lock = std::scoped_lock{mutex_};
  auto key = cosign::schema::key::make_session_key(session.id, recipient_id);
  auto existing = storage_.get<cosign::schema::cached_session_t>(
      encoder_, view(key));

  auto record = cosign::schema::cached_session_t{};
  record.session = session;
  record.recipient_id = std::string{recipient_id};
  record.cached_at = clock_();
  if (existing.has_value()) {
    record.last_synced_at = existing->last_synced_at;
  }
  record.sync_state = load_record(session.id, recipient_id).has_value()
                          ? cosign::schema::sync_state_t::queued
                          : cosign::schema::sync_state_t::local;
  storage_.put(encoder_, view(key), record);
}

std::optional<cosign::schema::cached_session_t> engine::load_session(
    std::string_view session_id,
    std::string_view recipient_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto key = cosign::schema::key::make_session_key(session_id, recipient_id);
  return storage_.get<cosign::schema::cached_session_t>(encoder_, view(key));
}

fetch_result_t engine::fetch_session(
    const cosign::schema::session_credentials_t& credentials) {
  if (auto cached =
          load_session(credentials.session_id, credentials.recipient_id);
      cached.has_value()) {
    return fetch_result_t{.code = 0, .cached = std::move(cached), .log = {}};
  }
  if (!can_sync()) {
    return fetch_result_t{
        .code = static_cast<uint32_t>(session_error_code::network_error),
        .cached = std::nullopt,
        .log = "session not cached and client is offline"};
  }

  auto response = fetch_response_t{};
  try {
    response = remote_.fetch_session(credentials).get();
  } catch (const std::exception& e) {
    response.status = remote_status_t::network_error;
    response.error = e.what();
  }

  switch (response.status) {
    case remote_status_t::ok:
    case remote_status_t::expired:
      break;
    case remote_status_t::not_found:
      return fetch_result_t{
          .code = static_cast<uint32_t>(session_error_code::not_found),
          .cached = std::nullopt,
          .log = "session not found"};
    case remote_status_t::invalid_credentials:
      return fetch_result_t{
          .code =
              static_cast<uint32_t>(session_error_code::invalid_credentials),
          .cached = std::nullopt,
          .log = "invalid signing link"};
    case remote_status_t::conflict:
    case remote_status_t::network_error:
      spdlog::warn("Fetching session {} failed: {}", credentials.session_id,
                   response.error);
      return fetch_result_t{
          .code = static_cast<uint32_t>(session_error_code::network_error),
          .cached = std::nullopt,
          .log = response.error.empty() ? std::string{"network error"}
                                        : response.error};
  }

  if (!response.session.has_value()) {
    if (response.status == remote_status_t::expired) {
      return fetch_result_t{
          .code = static_cast<uint32_t>(session_error_code::expired),
          .cached = std::nullopt,
          .log = "session expired"};
    }
    return fetch_result_t{
        .code = static_cast<uint32_t>(session_error_code::network_error),
        .cached = std::nullopt,
        .log = "authority returned no session"};
  }

  auto snapshot = std::move(*response.session);
  if (response.status == remote_status_t::expired) {
    snapshot.status = cosign::schema::session_status_t::expired;
  }
  cache_session(snapshot, credentials.recipient_id);
  auto cached = load_session(credentials.session_id, credentials.recipient_id);
  auto code = response.status == remote_status_t::expired
                  ? static_cast<uint32_t>(session_error_code::expired)
                  : 0u;
  return fetch_result_t{.code = code, .cached = std::move(cached), .log = {}};
}

void engine::save_signatures(
    std::string_view session_id,
    std::string_view recipient_id,
    const cosign::schema::signed_submission_t& signatures) {
  auto lock = std::scoped_lock{mutex_};
  auto key =
      cosign::schema::key::make_signatures_key(session_id, recipient_id);
  storage_.put(encoder_, view(key), signatures);
  spdlog::debug("Saved {} signature(s) for {}/{}",
                signatures.signatures.size(), session_id, recipient_id);
}

std::optional<cosign::schema::signed_submission_t> engine::load_signatures(
    std::string_view session_id,
    std::string_view recipient_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto key =
      cosign::schema::key::make_signatures_key(session_id, recipient_id);
  return storage_.get<cosign::schema::signed_submission_t>(encoder_,
                                                           view(key));
}

cosign::schema::sync_record_t engine::queue_for_sync(
    cosign::schema::sync_record_t record) {
  auto lock = std::scoped_lock{mutex_};
  auto now = clock_();
  auto previous = load_record(record.session_id, record.recipient_id);

  record.generation = next_generation();
  record.attempt_count = 0;
  record.last_error.reset();
  record.enqueued_at = now;
  record.next_attempt_at = now;
  // Consent already delivered for the same decision is not sent twice.
  record.consent_synced =
      previous.has_value() && previous->consent_synced &&
      previous->payload.consent.has_value() &&
      record.payload.consent.has_value() &&
      previous->payload.consent->consent_at ==
          record.payload.consent->consent_at;

  auto key = cosign::schema::key::make_queue_key(record.session_id,
                                                 record.recipient_id);
  storage_.write_batch(
      {cosign::storage::batch_entry{
           .key = cosign::schema::key::make_sync_generation_key(),
           .value = encoder_.encode(record.generation)},
       cosign::storage::batch_entry{.key = key,
                                    .value = encoder_.encode(record)}});
  if (previous.has_value()) {
    spdlog::info("Superseded queued record {}/{} (generation {} -> {})",
                 record.session_id, record.recipient_id,
                 previous->generation, record.generation);
  } else {
    spdlog::info("Queued record {}/{} (generation {})", record.session_id,
                 record.recipient_id, record.generation);
  }
  write_sync_state(record.session_id, record.recipient_id,
                   cosign::schema::sync_state_t::queued);
  return record;
}

std::vector<cosign::schema::sync_record_t> engine::pending() const {
  auto lock = std::scoped_lock{mutex_};
  auto records = std::vector<cosign::schema::sync_record_t>{};
  auto prefix = cosign::schema::key::make_queue_prefix();
  for (const auto& [key, value] : storage_.list_by_prefix(view(prefix))) {
    auto record =
        encoder_.try_decode<cosign::schema::sync_record_t>(view(value));
    if (!record.has_value()) {
      spdlog::warn("Skipping undecodable queue entry ({} bytes)",
                   value.size());
      continue;
    }
    records.push_back(std::move(*record));
  }
  std::ranges::sort(records, {}, &cosign::schema::sync_record_t::generation);
  return records;
}

sync_report_t engine::sync() {
  auto report = sync_report_t{};
  auto now = cosign::schema::timestamp_milliseconds_t{};
  {
    auto lock = std::scoped_lock{mutex_};
    auto status = load_status();
    if (status.offline_mode || !online_) {
      spdlog::debug("Sync skipped: offline");
      return report;
    }
    if (syncing_) {
      spdlog::debug("Sync skipped: drain already running");
      return report;
    }
    syncing_ = true;
    now = clock_();
    status.last_attempt_at = now;
    save_status(status);
  }
  report.attempted = true;

  for (const auto& record : pending()) {
    if (record.attempt_count >= config_.max_retries) {
      report.records.push_back(record_report_t{
          .session_id = record.session_id,
          .recipient_id = record.recipient_id,
          .outcome = record_outcome_t::stalled,
          .remote_status = std::nullopt,
          .detail = record.last_error.value_or("retries exhausted")});
      continue;
    }
    if (record.next_attempt_at > now) {
      report.records.push_back(record_report_t{
          .session_id = record.session_id,
          .recipient_id = record.recipient_id,
          .outcome = record_outcome_t::deferred,
          .remote_status = std::nullopt,
          .detail = {}});
      continue;
    }

    {
      auto lock = std::scoped_lock{mutex_};
      auto current = load_record(record.session_id, record.recipient_id);
      if (!current.has_value() || current->generation != record.generation) {
        spdlog::info("Record {}/{} superseded before sending", record.session_id,
                     record.recipient_id);
        report.records.push_back(record_report_t{
            .session_id = record.session_id,
            .recipient_id = record.recipient_id,
            .outcome = record_outcome_t::superseded,
            .remote_status = std::nullopt,
            .detail = {}});
        continue;
      }
      write_sync_state(record.session_id, record.recipient_id,
                       cosign::schema::sync_state_t::syncing);
    }
    auto attempt = submit(record);
    auto lock = std::scoped_lock{mutex_};
    apply_attempt(record, attempt, report);
  }

  auto lock = std::scoped_lock{mutex_};
  syncing_ = false;
  return report;
}

std::future<sync_report_t> engine::sync_async() {
  return std::async(std::launch::async, [this] { return sync(); });
}

remote_response_t engine::request_new_link(
    const cosign::schema::session_id_t& session_id,
    const cosign::schema::recipient_id_t& recipient_id) {
  if (!can_sync()) {
    return remote_response_t{.status = remote_status_t::network_error,
                             .session_status = std::nullopt,
                             .all_signed = false,
                             .download_url = std::nullopt,
                             .error = "offline"};
  }
  try {
    return remote_.request_link(session_id, recipient_id).get();
  } catch (const std::exception& e) {
    spdlog::warn("Link request for {} failed: {}", session_id, e.what());
    return remote_response_t{.status = remote_status_t::network_error,
                             .session_status = std::nullopt,
                             .all_signed = false,
                             .download_url = std::nullopt,
                             .error = e.what()};
  }
}

void engine::append_audit(const cosign::schema::audit_event_t& event) {
  auto lock = std::scoped_lock{mutex_};
  auto key =
      cosign::schema::key::make_audit_key(event.session_id, event.sequence);
  storage_.put(encoder_, view(key), event);
}

std::vector<cosign::schema::audit_event_t> engine::audit_trail(
    std::string_view session_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto events = std::vector<cosign::schema::audit_event_t>{};
  auto prefix = cosign::schema::key::make_audit_prefix(session_id);
  for (const auto& [key, value] : storage_.list_by_prefix(view(prefix))) {
    if (!cosign::schema::key::parse_audit_key(session_id, view(key))) {
      continue;
    }
    auto event =
        encoder_.try_decode<cosign::schema::audit_event_t>(view(value));
    if (!event.has_value()) {
      spdlog::warn("Undecodable audit event in session {}", session_id);
      continue;
    }
    events.push_back(std::move(*event));
  }
  return events;
}

std::optional<cosign::schema::audit_event_t> engine::last_audit_event(
    std::string_view session_id) const {
  auto events = audit_trail(session_id);
  if (events.empty()) {
    return std::nullopt;
  }
  return std::move(events.back());
}

cosign::schema::sync_status_t engine::status() const {
  auto status = cosign::schema::sync_status_t{};
  {
    auto lock = std::scoped_lock{mutex_};
    status = load_status();
    status.syncing = syncing_;
  }
  status.pending_count = static_cast<uint32_t>(pending().size());
  return status;
}

void engine::set_offline_mode(bool offline) {
  auto lock = std::scoped_lock{mutex_};
  auto status = load_status();
  status.offline_mode = offline;
  save_status(status);
  spdlog::info("Offline mode {}", offline ? "enabled" : "disabled");
}

void engine::set_online(bool online) {
  auto lock = std::scoped_lock{mutex_};
  online_ = online;
}

bool engine::can_sync() const {
  auto lock = std::scoped_lock{mutex_};
  return online_ && !load_status().offline_mode;
}

cosign::schema::duration_milliseconds_t engine::backoff_delay(
    uint32_t attempt_count) const {
  if (attempt_count == 0) {
    return 0;
  }
  auto delay = config_.min_backoff;
  for (auto i = uint32_t{1}; i < attempt_count && delay < config_.max_backoff;
       ++i) {
    delay *= 2;
  }
  return std::min(delay, config_.max_backoff);
}

engine::attempt_t engine::submit(const cosign::schema::sync_record_t& record) {
  auto attempt = attempt_t{};
  attempt.consent_synced = record.consent_synced;

  // Returns true when the step was accepted and the next one may run.
  auto evaluate = [&](const remote_response_t& response,
                      std::string_view step) {
    attempt.remote_status = response.status;
    if (response.status == remote_status_t::ok) {
      return true;
    }
    attempt.detail = std::string{step} + ": " +
                     (response.error.empty()
                          ? std::string{to_string(response.status)}
                          : response.error);
    if (response.status == remote_status_t::network_error) {
      attempt.outcome = record_outcome_t::retry_scheduled;
    } else if (response.session_status ==
               cosign::schema::session_status_t::completed) {
      attempt.outcome = record_outcome_t::redundant;
    } else {
      attempt.outcome = record_outcome_t::conflict;
    }
    return false;
  };

  auto call = [&](auto&& make_future,
                  std::string_view step) -> std::optional<remote_response_t> {
    try {
      return make_future().get();
    } catch (const std::exception& e) {
      attempt.remote_status = remote_status_t::network_error;
      attempt.outcome = record_outcome_t::retry_scheduled;
      attempt.detail = std::string{step} + ": " + e.what();
      return std::nullopt;
    }
  };

  const auto& payload = record.payload;
  if (payload.consent.has_value() && !record.consent_synced) {
    auto response = call(
        [&] {
          return remote_.record_consent(
              record.session_id,
              consent_request_t{
                  .recipient_id = record.recipient_id,
                  .user_agent = payload.consent->user_agent,
                  .consent_text_hash = payload.consent->consent_text_hash});
        },
        "consent");
    if (!response.has_value() || !evaluate(*response, "consent")) {
      return attempt;
    }
    attempt.consent_synced = true;
  }

  if (payload.decline.has_value()) {
    auto response = call(
        [&] {
          return remote_.decline(
              record.session_id,
              decline_request_t{.recipient_id = record.recipient_id,
                                .reason = payload.decline->reason});
        },
        "decline");
    if (!response.has_value() || !evaluate(*response, "decline")) {
      return attempt;
    }
  }

  if (payload.completed_at.has_value()) {
    auto response = call(
        [&] {
          return remote_.submit_signed(record.session_id, record.recipient_id,
                                       payload);
        },
        "signed");
    if (!response.has_value() || !evaluate(*response, "signed")) {
      return attempt;
    }
    if (response->all_signed) {
      attempt.detail = "all recipients signed";
    }
  }

  attempt.outcome = record_outcome_t::synced;
  return attempt;
}

void engine::apply_attempt(const cosign::schema::sync_record_t& sent,
                           const attempt_t& attempt,
                           sync_report_t& report) {
  auto entry = record_report_t{.session_id = sent.session_id,
                               .recipient_id = sent.recipient_id,
                               .outcome = attempt.outcome,
                               .remote_status = attempt.remote_status,
                               .detail = attempt.detail};

  auto current = load_record(sent.session_id, sent.recipient_id);
  if (!current.has_value() || current->generation != sent.generation) {
    spdlog::info("Record {}/{} superseded while in flight", sent.session_id,
                 sent.recipient_id);
    entry.outcome = record_outcome_t::superseded;
    report.records.push_back(std::move(entry));
    return;
  }

  auto now = clock_();
  auto key = cosign::schema::key::make_queue_key(sent.session_id,
                                                 sent.recipient_id);
  switch (attempt.outcome) {
    case record_outcome_t::synced:
    case record_outcome_t::redundant: {
      storage_.erase(view(key));
      write_sync_state(sent.session_id, sent.recipient_id,
                       cosign::schema::sync_state_t::synced, now);
      clear_error(sent.session_id, sent.recipient_id);
      auto status = load_status();
      status.last_success_at = now;
      save_status(status);
      if (attempt.outcome == record_outcome_t::redundant) {
        spdlog::info("Discarded {}/{}: session already completed remotely",
                     sent.session_id, sent.recipient_id);
      } else {
        spdlog::info("Synced {}/{}", sent.session_id, sent.recipient_id);
      }
      break;
    }
    case record_outcome_t::conflict: {
      storage_.erase(view(key));
      write_sync_state(sent.session_id, sent.recipient_id,
                       cosign::schema::sync_state_t::local);
      record_error(sent, attempt.detail);
      spdlog::warn("Dropped {}/{} after definitive rejection: {}",
                   sent.session_id, sent.recipient_id, attempt.detail);
      break;
    }
    case record_outcome_t::retry_scheduled:
    default: {
      auto retry = *current;
      retry.attempt_count += 1;
      retry.consent_synced = attempt.consent_synced;
      retry.last_error = attempt.detail;
      retry.next_attempt_at = now + backoff_delay(retry.attempt_count);
      storage_.put(encoder_, view(key), retry);
      write_sync_state(sent.session_id, sent.recipient_id,
                       cosign::schema::sync_state_t::queued);
      record_error(retry, attempt.detail);
      spdlog::warn("Sync of {}/{} failed (attempt {}), retry at {}: {}",
                   sent.session_id, sent.recipient_id, retry.attempt_count,
                   retry.next_attempt_at, attempt.detail);
      break;
    }
  }
  report.records.push_back(std::move(entry));
}

std::optional<cosign::schema::sync_record_t> engine::load_record(
    std::string_view session_id,
    std::string_view recipient_id) const {
  auto key = cosign::schema::key::make_queue_key(session_id, recipient_id);
  return storage_.get<cosign::schema::sync_record_t>(encoder_, view(key));
}

void engine::write_sync_state(
    std::string_view session_id,
    std::string_view recipient_id,
    cosign::schema::sync_state_t state,
    std::optional<cosign::schema::timestamp_milliseconds_t> synced_at) {
  auto key = cosign::schema::key::make_session_key(session_id, recipient_id);
  auto cached =
      storage_.get<cosign::schema::cached_session_t>(encoder_, view(key));
  if (!cached.has_value()) {
    return;
  }
  cached->sync_state = state;
  if (synced_at.has_value()) {
    cached->last_synced_at = synced_at;
  }
  storage_.put(encoder_, view(key), *cached);
}

cosign::schema::sync_status_t engine::load_status() const {
  auto key = cosign::schema::key::make_sync_status_key();
  return storage_.get<cosign::schema::sync_status_t>(encoder_, view(key))
      .value_or(cosign::schema::sync_status_t{});
}

void engine::save_status(const cosign::schema::sync_status_t& status) {
  auto key = cosign::schema::key::make_sync_status_key();
  storage_.put(encoder_, view(key), status);
}

void engine::record_error(const cosign::schema::sync_record_t& record,
                          std::string error) {
  auto status = load_status();
  std::erase_if(status.errors, [&](const auto& e) {
    return e.session_id == record.session_id &&
           e.recipient_id == record.recipient_id;
  });
  status.errors.push_back(
      cosign::schema::sync_error_t{.session_id = record.session_id,
                                   .recipient_id = record.recipient_id,
                                   .error = std::move(error),
                                   .attempt_count = record.attempt_count,
                                   .recorded_at = clock_()});
  save_status(status);
}

void engine::clear_error(std::string_view session_id,
                         std::string_view recipient_id) {
  auto status = load_status();
  auto removed = std::erase_if(status.errors, [&](const auto& e) {
    return e.session_id == session_id && e.recipient_id == recipient_id;
  });
  if (removed > 0) {
    save_status(status);
  }
}

uint64_t engine::next_generation() const {
  auto key = cosign::schema::key::make_sync_generation_key();
  return storage_.get<uint64_t>(encoder_, view(key)).value_or(0) + 1;
}

}  // namespace cosign::sync
