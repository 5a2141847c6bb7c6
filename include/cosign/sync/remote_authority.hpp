#pragma once

#include <cosign/schema/enum_string.hpp>
#include <cosign/schema/primitives.hpp>
#include <cosign/schema/session.hpp>
#include <cosign/schema/session_credentials.hpp>
#include <cosign/schema/signed_submission.hpp>
#include <array>
#include <cstdint>
#include <future>
#include <optional>
#include <string>
#include <string_view>

namespace cosign::sync {

enum class remote_status_t : uint8_t {
  ok = 0,
  not_found = 1,
  invalid_credentials = 2,
  expired = 3,
  conflict = 4,
  network_error = 5
};

inline constexpr auto kRemoteStatusMappings = std::array{
    std::pair<std::string_view, remote_status_t>{"ok", remote_status_t::ok},
    std::pair<std::string_view, remote_status_t>{"not_found",
                                                 remote_status_t::not_found},
    std::pair<std::string_view, remote_status_t>{
        "invalid_credentials", remote_status_t::invalid_credentials},
    std::pair<std::string_view, remote_status_t>{"expired",
                                                 remote_status_t::expired},
    std::pair<std::string_view, remote_status_t>{"conflict",
                                                 remote_status_t::conflict},
    std::pair<std::string_view, remote_status_t>{
        "network_error", remote_status_t::network_error}};

inline constexpr std::string_view to_string(const remote_status_t value) {
  return cosign::schema::name_of(value, kRemoteStatusMappings);
}

struct fetch_response_t final {
  remote_status_t status{remote_status_t::ok};
  /// Present on ok, and on expired when the body carried a session.
  std::optional<cosign::schema::session_t> session;
  std::string error;
};

struct consent_request_t final {
  cosign::schema::recipient_id_t recipient_id;
  std::string user_agent;
  cosign::schema::hash32_t consent_text_hash{};
};

struct decline_request_t final {
  cosign::schema::recipient_id_t recipient_id;
  std::optional<std::string> reason;
};

struct remote_response_t final {
  remote_status_t status{remote_status_t::ok};
  /// Session status reported by the authority, when it sent one.
  std::optional<cosign::schema::session_status_t> session_status;
  bool all_signed{};
  std::optional<std::string> download_url;
  std::string error;
};

/// The server that owns the authoritative copy of every session.
///
/// Implementations perform the HTTP exchange; every call is asynchronous and
/// a transport failure resolves to remote_status_t::network_error rather
/// than to an exception.
class remote_authority {
 public:
  virtual ~remote_authority() = default;

  /// GET /session/{id}
  virtual std::future<fetch_response_t> fetch_session(
      const cosign::schema::session_credentials_t& credentials) = 0;

  /// POST /session/{id}/signed
  virtual std::future<remote_response_t> submit_signed(
      const cosign::schema::session_id_t& session_id,
      const cosign::schema::recipient_id_t& recipient_id,
      const cosign::schema::signed_submission_t& submission) = 0;

  /// PUT /session/{id}/consent
  virtual std::future<remote_response_t> record_consent(
      const cosign::schema::session_id_t& session_id,
      const consent_request_t& request) = 0;

  /// PUT /session/{id}/decline
  virtual std::future<remote_response_t> decline(
      const cosign::schema::session_id_t& session_id,
      const decline_request_t& request) = 0;

  /// POST /session/{id}/request-link
  virtual std::future<remote_response_t> request_link(
      const cosign::schema::session_id_t& session_id,
      const cosign::schema::recipient_id_t& recipient_id) = 0;
};

}  // namespace cosign::sync
