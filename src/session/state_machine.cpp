#include <spdlog/spdlog.h>
#include <algorithm>
#include <cosign/ordering/coordinator.hpp>
#include <cosign/schema/session_error_code.hpp>
#include <cosign/session/audit_chain.hpp>
#include <cosign/session/state_machine.hpp>
#include <cosign/session/validation.hpp>
#include <exception>
#include <utility>
#include <variant>

namespace cosign::session {

namespace {

using cosign::schema::audit_action_t;
using cosign::schema::operation_result_t;
using cosign::schema::session_error_code;
using cosign::schema::session_phase_t;
using cosign::schema::session_status_t;

operation_result_t make_error(
    session_error_code code,
    std::string log,
    std::string info = {},
    std::string_view codespace = cosign::schema::kSessionCodespace) {
  auto result = operation_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

operation_result_t make_not_loaded() {
  return make_error(session_error_code::invalid_transition,
                    "no session loaded");
}

operation_result_t make_unknown_recipient(std::string_view recipient_id) {
  return make_error(session_error_code::validation_error, "unknown recipient",
                    std::string{recipient_id});
}

operation_result_t make_wrong_phase(session_phase_t phase) {
  if (phase == session_phase_t::expired) {
    return make_error(session_error_code::expired, "session expired");
  }
  return make_error(session_error_code::invalid_transition,
                    "operation not allowed in this phase",
                    std::string{cosign::schema::to_string(phase)});
}

// A signer that owns at least one required field; declining one of these
// declines the whole session.
bool is_required_signer(const cosign::schema::session_t& session,
                        const cosign::schema::recipient_t& recipient) {
  if (recipient.role != cosign::schema::recipient_role_t::signer) {
    return false;
  }
  return std::ranges::any_of(session.fields, [&](const auto& field) {
    return field.recipient_id == recipient.id && field.required;
  });
}

}  // namespace

state_machine::state_machine(sync::encoder_t& encoder,
                             sync::engine& engine,
                             email_sender& email,
                             cosign::common::time_source_t clock,
                             cosign::schema::duration_milliseconds_t session_ttl)
    : encoder_{encoder},
      engine_{engine},
      email_{email},
      clock_{std::move(clock)},
      session_ttl_{session_ttl} {}

operation_result_t state_machine::create(cosign::schema::session_t session) {
  auto validation = validate_session(session);
  if (validation.code != 0) {
    spdlog::warn("Rejected session {}: {} {}", session.id, validation.log,
                 validation.info);
    return validation;
  }
  if (engine_.load_session(session.id, session.created_by).has_value()) {
    return make_error(session_error_code::validation_error,
                      "session already exists", session.id);
  }

  auto now = clock_();
  session.created_at = now;
  session.updated_at = now;
  if (!session.expires_at.has_value()) {
    session.expires_at = now + session_ttl_;
  }
  viewer_ = session.created_by;
  session_ = std::move(session);
  engine_.store_session(*session_, viewer_);
  audit(viewer_, audit_action_t::session_created,
        std::to_string(session_->recipients.size()) + " recipient(s), " +
            std::to_string(session_->fields.size()) + " field(s)");
  spdlog::info("Created session {} ({}, {})", session_->id,
               session_->document_name,
               cosign::schema::to_string(session_->signing_mode));
  return operation_result_t{};
}

load_result_t state_machine::load(
    const cosign::schema::session_credentials_t& credentials) {
  auto result = load_result_t{};
  result.codespace = std::string{cosign::schema::kSessionCodespace};

  auto validation = validate_credentials(credentials);
  if (validation.code != 0) {
    result.code = validation.code;
    result.log = validation.log;
    return result;
  }

  auto fetched = engine_.fetch_session(credentials);
  auto expired_remotely =
      fetched.code == static_cast<uint32_t>(session_error_code::expired);
  if (fetched.code != 0 && !(expired_remotely && fetched.cached.has_value())) {
    spdlog::warn("Failed to load session {}: {}", credentials.session_id,
                 fetched.log);
    result.code = fetched.code;
    result.log = std::move(fetched.log);
    if (fetched.code ==
        static_cast<uint32_t>(session_error_code::network_error)) {
      result.codespace = std::string{cosign::schema::kSyncCodespace};
    }
    return result;
  }

  auto& loaded = fetched.cached->session;
  auto recipient = std::ranges::find(loaded.recipients,
                                     credentials.recipient_id,
                                     &cosign::schema::recipient_t::id);
  if (recipient == std::end(loaded.recipients)) {
    result.code = static_cast<uint32_t>(session_error_code::not_found);
    result.log = "recipient not part of session";
    return result;
  }

  session_ = std::move(loaded);
  viewer_ = credentials.recipient_id;
  if (!expire_if_due()) {
    audit(viewer_, audit_action_t::session_loaded);
  }

  result.phase = phase(viewer_);
  result.session = session_;
  if (session_->status == session_status_t::expired) {
    result.code = static_cast<uint32_t>(session_error_code::expired);
    result.log = "session expired";
  }
  spdlog::info("Loaded session {} for {} in phase {}", session_->id, viewer_,
               cosign::schema::to_string(result.phase));
  return result;
}

operation_result_t state_machine::record_consent(
    std::string_view recipient_id,
    const cosign::schema::hash32_t& consent_text_hash,
    std::string_view user_agent) {
  if (!session_) {
    return make_not_loaded();
  }
  expire_if_due();
  auto* recipient = find_recipient(recipient_id);
  if (recipient == nullptr) {
    return make_unknown_recipient(recipient_id);
  }
  if (recipient->consent_at.has_value()) {
    spdlog::debug("Consent of {} already recorded", recipient_id);
    return operation_result_t{};
  }
  auto current = phase(recipient_id);
  if (current != session_phase_t::consent_pending) {
    return make_wrong_phase(current);
  }

  recipient->consent_at = clock_();
  recipient->consent_text_hash = consent_text_hash;
  recipient->consent_user_agent = std::string{user_agent};
  commit();
  queue(*recipient);
  audit(recipient_id, audit_action_t::consent_recorded,
        cosign::schema::to_hex(consent_text_hash));
  spdlog::info("Recorded consent of {} in session {}", recipient_id,
               session_->id);
  return operation_result_t{};
}

operation_result_t state_machine::complete_field(
    std::string_view recipient_id,
    std::string_view field_id,
    const cosign::schema::field_value_t& value) {
  if (!session_) {
    return make_not_loaded();
  }
  expire_if_due();
  if (find_recipient(recipient_id) == nullptr) {
    return make_unknown_recipient(recipient_id);
  }
  auto current = phase(recipient_id);
  if (current != session_phase_t::signing_active) {
    return make_wrong_phase(current);
  }

  auto* field = find_field(field_id);
  if (field == nullptr) {
    return make_error(session_error_code::invalid_field, "unknown field",
                      std::string{field_id});
  }
  if (field->recipient_id != recipient_id) {
    return make_error(session_error_code::invalid_field,
                      "field belongs to another recipient",
                      std::string{field_id});
  }
  if (!cosign::schema::accepts(field->type, value)) {
    return make_error(session_error_code::invalid_field,
                      "value does not match field type",
                      std::string{cosign::schema::to_string(field->type)});
  }
  if (field->completed) {
    return make_error(session_error_code::invalid_transition,
                      "field already completed", std::string{field_id});
  }
  auto gate = cosign::ordering::check_field(*session_, recipient_id, field_id);
  if (gate == cosign::ordering::field_gate_t::blocked_by_order) {
    spdlog::warn("Field {} of {} is blocked by signing order", field_id,
                 recipient_id);
    return make_error(session_error_code::ordering_violation,
                      "earlier signers have not finished",
                      std::string{field_id});
  }
  if (gate != cosign::ordering::field_gate_t::actionable) {
    return make_error(session_error_code::invalid_field,
                      "field is not actionable", std::string{field_id});
  }

  field->completed = true;
  field->value = value;
  field->completed_at = clock_();
  auto* recipient = find_recipient(recipient_id);
  engine_.save_signatures(session_->id, recipient_id,
                          build_submission(*recipient));
  commit();
  audit(recipient_id, audit_action_t::field_completed,
        std::string{field_id});
  return operation_result_t{};
}

operation_result_t state_machine::reset_field(std::string_view recipient_id,
                                              std::string_view field_id) {
  if (!session_) {
    return make_not_loaded();
  }
  expire_if_due();
  if (find_recipient(recipient_id) == nullptr) {
    return make_unknown_recipient(recipient_id);
  }
  auto current = phase(recipient_id);
  if (current != session_phase_t::signing_active) {
    return make_wrong_phase(current);
  }
  auto* field = find_field(field_id);
  if (field == nullptr || field->recipient_id != recipient_id) {
    return make_error(session_error_code::invalid_field,
                      "not a field of this recipient", std::string{field_id});
  }
  if (!field->completed) {
    return make_error(session_error_code::invalid_transition,
                      "field is not completed", std::string{field_id});
  }
  if (cosign::ordering::later_signers_started(*session_, recipient_id)) {
    spdlog::warn("Field {} of {} is frozen by later signers", field_id,
                 recipient_id);
    return make_error(session_error_code::ordering_violation,
                      "later signers have already acted",
                      std::string{field_id});
  }

  field->completed = false;
  field->value.reset();
  field->completed_at.reset();
  auto* recipient = find_recipient(recipient_id);
  engine_.save_signatures(session_->id, recipient_id,
                          build_submission(*recipient));
  commit();
  audit(recipient_id, audit_action_t::field_reset, std::string{field_id});
  return operation_result_t{};
}

operation_result_t state_machine::finish(std::string_view recipient_id) {
  if (!session_) {
    return make_not_loaded();
  }
  expire_if_due();
  auto* recipient = find_recipient(recipient_id);
  if (recipient == nullptr) {
    return make_unknown_recipient(recipient_id);
  }
  auto current = phase(recipient_id);
  if (current != session_phase_t::signing_active) {
    return make_wrong_phase(current);
  }
  if (!cosign::ordering::recipient_unblocked(*session_, recipient_id)) {
    return make_error(session_error_code::ordering_violation,
                      "earlier signers have not finished");
  }
  if (auto missing =
          cosign::ordering::first_incomplete_required(*session_, recipient_id);
      missing.has_value()) {
    auto result = make_error(session_error_code::incomplete_required_fields,
                             "required fields are incomplete", *missing);
    result.field_id = std::move(missing);
    return result;
  }

  recipient->finished_at = clock_();
  auto completed = maybe_complete();
  engine_.save_signatures(session_->id, recipient_id,
                          build_submission(*recipient));
  commit();
  queue(*recipient);
  audit(recipient_id, audit_action_t::recipient_finished);
  spdlog::info("Recipient {} finished session {}", recipient_id, session_->id);
  notify(recipient->name + " Signed: " + session_->document_name,
         recipient->name + " <" + recipient->email + "> signed " +
             session_->document_name + ".");
  if (completed) {
    audit(recipient_id, audit_action_t::session_completed);
    spdlog::info("Session {} completed", session_->id);
    notify("All Recipients Signed: " + session_->document_name,
           "Every signer has signed " + session_->document_name + ".");
  }
  return operation_result_t{};
}

operation_result_t state_machine::decline(std::string_view recipient_id,
                                          std::optional<std::string> reason) {
  if (!session_) {
    return make_not_loaded();
  }
  expire_if_due();
  auto* recipient = find_recipient(recipient_id);
  if (recipient == nullptr) {
    return make_unknown_recipient(recipient_id);
  }
  auto current = phase(recipient_id);
  if (current != session_phase_t::consent_pending &&
      current != session_phase_t::signing_active) {
    return make_wrong_phase(current);
  }

  recipient->declined_at = clock_();
  recipient->decline_reason = std::move(reason);
  for (auto& field : session_->fields) {
    if (field.recipient_id == recipient_id) {
      field.completed = false;
      field.value.reset();
      field.completed_at.reset();
    }
  }

  auto session_declined = is_required_signer(*session_, *recipient);
  auto completed = false;
  if (session_declined) {
    session_->status = session_status_t::declined;
  } else {
    completed = maybe_complete();
  }
  engine_.save_signatures(session_->id, recipient_id,
                          build_submission(*recipient));
  commit();
  queue(*recipient);
  audit(recipient_id, audit_action_t::recipient_declined,
        recipient->decline_reason.value_or(""));
  spdlog::info("Recipient {} declined session {}", recipient_id, session_->id);
  notify(recipient->name + " Declined: " + session_->document_name,
         recipient->name + " <" + recipient->email + "> declined " +
             session_->document_name + ". Reason: " +
             recipient->decline_reason.value_or("none given"));
  if (session_declined) {
    audit(recipient_id, audit_action_t::session_declined);
  }
  if (completed) {
    audit(recipient_id, audit_action_t::session_completed);
    notify("All Recipients Signed: " + session_->document_name,
           "Every signer has signed " + session_->document_name + ".");
  }
  return operation_result_t{};
}

operation_result_t state_machine::request_new_link(
    std::string_view recipient_id) {
  if (!session_) {
    return make_not_loaded();
  }
  expire_if_due();
  if (find_recipient(recipient_id) == nullptr) {
    return make_unknown_recipient(recipient_id);
  }
  auto current = phase(recipient_id);
  if (current != session_phase_t::expired) {
    return make_wrong_phase(current);
  }

  auto response = engine_.request_new_link(session_->id,
                                           std::string{recipient_id});
  if (response.status != sync::remote_status_t::ok) {
    auto code = response.status == sync::remote_status_t::network_error
                    ? session_error_code::network_error
                    : session_error_code::conflict;
    spdlog::warn("New link request for {} failed: {}", recipient_id,
                 response.error);
    return make_error(code, "link request failed", response.error,
                      cosign::schema::kSyncCodespace);
  }
  audit(recipient_id, audit_action_t::link_requested);
  return operation_result_t{};
}

operation_result_t state_machine::attach_timestamp(
    cosign::timestamp::transport& transport,
    const std::string& url,
    const cosign::timestamp::validation_policy_t& policy) {
  if (!session_) {
    return make_not_loaded();
  }
  if (session_->status != session_status_t::completed) {
    return make_error(session_error_code::invalid_transition,
                      "only completed sessions are timestamped");
  }
  auto fail = [&](std::string log, std::string info) {
    spdlog::warn("Timestamp of session {} not attached: {} {}", session_->id,
                 log, info);
    return make_error(session_error_code::timestamp_error, std::move(log),
                      std::move(info), cosign::schema::kTimestampCodespace);
  };

  auto digest_input = *session_;
  digest_input.timestamp_token.reset();
  auto message = encoder_.encode(digest_input);
  auto request = cosign::timestamp::build_request(
      cosign::schema::make_bytes_view(message),
      cosign::timestamp::make_nonce());
  auto request_time = clock_();

  auto response = cosign::timestamp::transport_response_t{};
  try {
    response = cosign::timestamp::send_request(transport, url, request).get();
  } catch (const std::exception& e) {
    return fail("TSA unreachable", e.what());
  }
  if (response.http_status != 200) {
    return fail("TSA request failed",
                response.http_status == 0
                    ? response.error
                    : "HTTP " + std::to_string(response.http_status));
  }

  auto parsed = cosign::timestamp::parse_response(
      cosign::schema::make_bytes_view(response.body));
  auto result = operation_result_t{};
  std::visit(
      overloaded{
          [&](const cosign::timestamp::parse_error_t& error) {
            result = fail("malformed TSA response", error.reason);
          },
          [&](const cosign::timestamp::timestamp_rejection_t& rejection) {
            result = fail("TSA rejected the request",
                          std::string{to_string(rejection.status)} + ": " +
                              rejection.status_text);
          },
          [&](const cosign::timestamp::timestamp_token_t& token) {
            auto check = cosign::timestamp::validate_token(
                token, request, request_time, policy);
            if (check.check != cosign::timestamp::token_check_t::ok) {
              result = fail("invalid timestamp token", check.reason);
              return;
            }
            session_->timestamp_token = token.der;
            commit();
            audit(viewer_, audit_action_t::timestamp_attached,
                  token.serial_hex);
            spdlog::info("Attached timestamp {} to session {}",
                         token.serial_hex, session_->id);
          }},
      parsed);
  return result;
}

cosign::schema::session_phase_t state_machine::phase(
    std::string_view recipient_id) const {
  if (!session_) {
    return session_phase_t::loading;
  }
  switch (session_->status) {
    case session_status_t::expired:
      return session_phase_t::expired;
    case session_status_t::declined:
      return session_phase_t::declined;
    case session_status_t::completed:
      return session_phase_t::completed;
    case session_status_t::active:
      break;
  }
  if (session_->expires_at.has_value() && clock_() >= *session_->expires_at) {
    return session_phase_t::expired;
  }
  auto recipient = std::ranges::find(session_->recipients, recipient_id,
                                     &cosign::schema::recipient_t::id);
  if (recipient == std::end(session_->recipients)) {
    return session_phase_t::loading;
  }
  if (recipient->declined_at.has_value()) {
    return session_phase_t::declined;
  }
  if (recipient->finished_at.has_value()) {
    return session_phase_t::completed;
  }
  if (!recipient->consent_at.has_value()) {
    return session_phase_t::consent_pending;
  }
  return session_phase_t::signing_active;
}

cosign::schema::recipient_t* state_machine::find_recipient(
    std::string_view recipient_id) {
  auto it = std::ranges::find(session_->recipients, recipient_id,
                              &cosign::schema::recipient_t::id);
  return it == std::end(session_->recipients) ? nullptr : &*it;
}

cosign::schema::field_t* state_machine::find_field(std::string_view field_id) {
  auto it = std::ranges::find(session_->fields, field_id,
                              &cosign::schema::field_t::id);
  return it == std::end(session_->fields) ? nullptr : &*it;
}

bool state_machine::expire_if_due() {
  if (session_->status != session_status_t::active ||
      !session_->expires_at.has_value() || clock_() < *session_->expires_at) {
    return false;
  }
  session_->status = session_status_t::expired;
  commit();
  audit(viewer_, audit_action_t::session_expired);
  spdlog::info("Session {} expired", session_->id);
  return true;
}

void state_machine::commit() {
  session_->updated_at = std::max(session_->updated_at, clock_());
  engine_.store_session(*session_, viewer_);
}

void state_machine::audit(std::string_view recipient_id,
                          cosign::schema::audit_action_t action,
                          std::string details) {
  auto event = make_audit_event(encoder_,
                                engine_.last_audit_event(session_->id),
                                session_->id, std::string{recipient_id},
                                action, clock_(), std::move(details));
  engine_.append_audit(event);
}

cosign::schema::signed_submission_t state_machine::build_submission(
    const cosign::schema::recipient_t& recipient) const {
  auto submission = cosign::schema::signed_submission_t{};
  if (recipient.consent_at.has_value()) {
    submission.consent = cosign::schema::consent_submission_t{
        .consent_text_hash = recipient.consent_text_hash.value_or(
            cosign::schema::make_zero_hash()),
        .user_agent = recipient.consent_user_agent.value_or(""),
        .consent_at = *recipient.consent_at};
  }
  if (recipient.declined_at.has_value()) {
    submission.decline = cosign::schema::decline_submission_t{
        .reason = recipient.decline_reason,
        .declined_at = *recipient.declined_at};
  }
  for (const auto& field : session_->fields) {
    if (field.recipient_id != recipient.id || !field.completed ||
        !field.value.has_value()) {
      continue;
    }
    submission.signatures.push_back(cosign::schema::field_signature_t{
        .field_id = field.id,
        .value = *field.value,
        .completed_at = field.completed_at.value_or(0)});
  }
  submission.completed_at = recipient.finished_at;
  return submission;
}

void state_machine::queue(const cosign::schema::recipient_t& recipient) {
  auto record = cosign::schema::sync_record_t{};
  record.session_id = session_->id;
  record.recipient_id = recipient.id;
  record.payload = build_submission(recipient);
  engine_.queue_for_sync(std::move(record));
}

bool state_machine::maybe_complete() {
  auto signers = 0u;
  auto finished = 0u;
  for (const auto& recipient : session_->recipients) {
    if (recipient.role != cosign::schema::recipient_role_t::signer) {
      continue;
    }
    ++signers;
    if (recipient.finished_at.has_value()) {
      ++finished;
    } else if (!recipient.declined_at.has_value()) {
      return false;
    }
  }
  if (signers == 0 || finished == 0) {
    return false;
  }
  session_->status = session_status_t::completed;
  return true;
}

void state_machine::notify(std::string subject, std::string body) {
  if (!session_->sender_email.has_value() || session_->sender_email->empty()) {
    return;
  }
  auto payload = email_payload_t{.to = *session_->sender_email,
                                 .subject = std::move(subject),
                                 .body = std::move(body)};
  try {
    auto sent = email_.send(payload);
    if (!sent.delivered) {
      spdlog::warn("Notification '{}' not delivered: {}", payload.subject,
                   sent.error);
    }
  } catch (const std::exception& e) {
    spdlog::warn("Notification '{}' failed: {}", payload.subject, e.what());
  }
}

}  // namespace cosign::session
