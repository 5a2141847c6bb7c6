#pragma once

#include <cosign/common/time_source.hpp>
#include <cosign/schema/audit_action.hpp>
#include <cosign/schema/field_value.hpp>
#include <cosign/schema/operation_result.hpp>
#include <cosign/schema/primitives.hpp>
#include <cosign/schema/session.hpp>
#include <cosign/schema/session_credentials.hpp>
#include <cosign/schema/session_phase.hpp>
#include <cosign/schema/signed_submission.hpp>
#include <cosign/session/email_sender.hpp>
#include <cosign/sync/engine.hpp>
#include <cosign/timestamp/client.hpp>
#include <cosign/timestamp/transport.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cosign::session {

/// One week.
inline constexpr auto kDefaultSessionTtl =
    cosign::schema::duration_milliseconds_t{168ull * 60 * 60 * 1000};

struct load_result_t final {
  /// Zero on success, otherwise a session_error_code.
  uint32_t code{};
  std::string log;
  std::string codespace;
  std::optional<cosign::schema::session_t> session;
  cosign::schema::session_phase_t phase{
      cosign::schema::session_phase_t::loading};
};

/// Lifecycle of one signing session.
///
/// The machine owns the session it loaded or created and is its only
/// writer. Every accepted transition is persisted through the sync engine
/// before the call returns, appended to the session's audit chain and, where
/// the sender cares, announced through the email sender. Rejected operations
/// leave the session untouched and report a session_error_code.
///
/// The phase of each recipient is derived from the session data, never
/// stored, so a reloaded session resumes exactly where it left off.
class state_machine final {
 public:
  state_machine(sync::encoder_t& encoder,
                sync::engine& engine,
                email_sender& email,
                cosign::common::time_source_t clock,
                cosign::schema::duration_milliseconds_t session_ttl =
                    kDefaultSessionTtl);

  /// Validate and persist a new session owned by `session.created_by`.
  ///
  /// `created_at` and `updated_at` are stamped from the clock; `expires_at`
  /// defaults to created_at + session_ttl.
  cosign::schema::operation_result_t create(cosign::schema::session_t session);

  /// Resolve a signing link, local cache first.
  ///
  /// An expired session is loaded but reported with the expired code; only
  /// request_new_link is accepted afterwards.
  load_result_t load(const cosign::schema::session_credentials_t& credentials);

  /// Idempotent: a recipient that already consented gets a no-op success
  /// and keeps its original consent_at.
  cosign::schema::operation_result_t record_consent(
      std::string_view recipient_id,
      const cosign::schema::hash32_t& consent_text_hash,
      std::string_view user_agent);

  cosign::schema::operation_result_t complete_field(
      std::string_view recipient_id,
      std::string_view field_id,
      const cosign::schema::field_value_t& value);

  /// Undo a completed field while the recipient is still signing.
  cosign::schema::operation_result_t reset_field(std::string_view recipient_id,
                                                 std::string_view field_id);

  /// Seal the recipient. Fails with incomplete_required_fields naming the
  /// first incomplete required field in navigation order.
  cosign::schema::operation_result_t finish(std::string_view recipient_id);

  cosign::schema::operation_result_t decline(
      std::string_view recipient_id,
      std::optional<std::string> reason = std::nullopt);

  /// Only valid while the recipient's phase is expired.
  cosign::schema::operation_result_t request_new_link(
      std::string_view recipient_id);

  /// Timestamp a completed session through the TSA at `url`.
  ///
  /// The digest input is the SCALE encoding of the session without a token.
  /// Every failure is reported with the timestamp_error code and leaves the
  /// session as it was.
  cosign::schema::operation_result_t attach_timestamp(
      cosign::timestamp::transport& transport,
      const std::string& url,
      const cosign::timestamp::validation_policy_t& policy = {});

  cosign::schema::session_phase_t phase(std::string_view recipient_id) const;

  const std::optional<cosign::schema::session_t>& session() const {
    return session_;
  }

 private:
  cosign::schema::recipient_t* find_recipient(std::string_view recipient_id);
  cosign::schema::field_t* find_field(std::string_view field_id);

  /// Moves an active session past its expires_at to expired. Returns true
  /// when it did.
  bool expire_if_due();

  void commit();
  void audit(std::string_view recipient_id,
             cosign::schema::audit_action_t action,
             std::string details = {});
  cosign::schema::signed_submission_t build_submission(
      const cosign::schema::recipient_t& recipient) const;
  void queue(const cosign::schema::recipient_t& recipient);
  /// Completes the session when no signer is outstanding. Returns true when
  /// it did.
  bool maybe_complete();
  void notify(std::string subject, std::string body);

  sync::encoder_t& encoder_;
  sync::engine& engine_;
  email_sender& email_;
  cosign::common::time_source_t clock_;
  cosign::schema::duration_milliseconds_t session_ttl_;
  std::optional<cosign::schema::session_t> session_;
  /// Recipient whose local copy this machine persists to.
  cosign::schema::recipient_id_t viewer_;
};

}  // namespace cosign::session
