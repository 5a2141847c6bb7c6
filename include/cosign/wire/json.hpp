#pragma once

#include <cosign/schema/field_value.hpp>
#include <cosign/schema/recipient.hpp>
#include <cosign/schema/field.hpp>
#include <cosign/schema/session.hpp>
#include <cosign/schema/signed_submission.hpp>
#include <cosign/sync/remote_authority.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// JSON representation used by the remote authority's HTTP API. Keys are
// snake_case, times are Unix milliseconds, hashes are lowercase hex and the
// timestamp token is base64.
namespace cosign::schema {

void to_json(nlohmann::json& j, const field_value_t& value);
void from_json(const nlohmann::json& j, field_value_t& value);
void to_json(nlohmann::json& j, const recipient_t& recipient);
void from_json(const nlohmann::json& j, recipient_t& recipient);
void to_json(nlohmann::json& j, const field_t& field);
void from_json(const nlohmann::json& j, field_t& field);
void to_json(nlohmann::json& j, const session_t& session);
void from_json(const nlohmann::json& j, session_t& session);
void to_json(nlohmann::json& j, const signed_submission_t& submission);

}  // namespace cosign::schema

namespace cosign::wire {

/// Session from a JSON body; std::nullopt with `error` set when the body is
/// not valid JSON or misses a required member.
std::optional<cosign::schema::session_t> parse_session(std::string_view body,
                                                       std::string& error);
std::string serialize_session(const cosign::schema::session_t& session);

/// Body of POST /session/{id}/signed.
std::string serialize_submission(
    const cosign::schema::recipient_id_t& recipient_id,
    const cosign::schema::signed_submission_t& submission);
/// Body of PUT /session/{id}/consent.
std::string serialize_consent(const cosign::sync::consent_request_t& request);
/// Body of PUT /session/{id}/decline.
std::string serialize_decline(const cosign::sync::decline_request_t& request);

/// Classify a GET /session/{id} exchange. `http_status` zero means no
/// response was received.
cosign::sync::fetch_response_t interpret_fetch(uint16_t http_status,
                                               std::string_view body);

/// Classify the response to a signed, consent, decline or request-link call.
cosign::sync::remote_response_t interpret_mutation(uint16_t http_status,
                                                   std::string_view body);

}  // namespace cosign::wire
