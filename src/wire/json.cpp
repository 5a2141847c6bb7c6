#include <spdlog/spdlog.h>
#include <cosign/wire/json.hpp>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace cosign::schema {

namespace {

template <typename Enum>
Enum enum_from_json(const json& j, std::string_view what) {
  auto value = try_from_string<Enum>(j.get<std::string>());
  if (!value) {
    throw std::invalid_argument{"unknown " + std::string{what} + ": " +
                                j.get<std::string>()};
  }
  return *value;
}

template <typename T>
void set_optional(json& j, const char* key, const std::optional<T>& value) {
  if (value.has_value()) {
    j[key] = *value;
  }
}

template <typename T>
std::optional<T> get_optional(const json& j, const char* key) {
  if (!j.contains(key) || j.at(key).is_null()) {
    return std::nullopt;
  }
  return j.at(key).get<T>();
}

hash32_t hash_from_hex(const std::string& hex) {
  auto hash = try_make_hash32(hex);
  if (!hash) {
    throw std::invalid_argument{"invalid hash: " + hex};
  }
  return *hash;
}

}  // namespace

void to_json(json& j, const field_value_t& value) {
  std::visit(
      overloaded{[&](const drawn_signature_t& v) {
                   j = json{{"kind", "drawn"}, {"image_ref", v.image_ref}};
                 },
                 [&](const typed_text_t& v) {
                   j = json{{"kind", "typed"}, {"text", v.text},
                            {"font", v.font}};
                 },
                 [&](const date_value_t& v) {
                   j = json{{"kind", "date"}, {"date", v.date}};
                 },
                 [&](const checkbox_value_t& v) {
                   j = json{{"kind", "checkbox"}, {"checked", v.checked}};
                 }},
      value);
}

void from_json(const json& j, field_value_t& value) {
  auto kind = j.at("kind").get<std::string>();
  if (kind == "drawn") {
    value = drawn_signature_t{.image_ref = j.at("image_ref").get<std::string>()};
  } else if (kind == "typed") {
    value = typed_text_t{.text = j.at("text").get<std::string>(),
                         .font = j.value("font", std::string{})};
  } else if (kind == "date") {
    value = date_value_t{.date = j.at("date").get<std::string>()};
  } else if (kind == "checkbox") {
    value = checkbox_value_t{.checked = j.at("checked").get<bool>()};
  } else {
    throw std::invalid_argument{"unknown field value kind: " + kind};
  }
}

void to_json(json& j, const recipient_t& recipient) {
  j = json{{"id", recipient.id},
           {"name", recipient.name},
           {"email", recipient.email},
           {"role", std::string{to_string(recipient.role)}},
           {"order", recipient.order}};
  set_optional(j, "consent_at", recipient.consent_at);
  if (recipient.consent_text_hash.has_value()) {
    j["consent_text_hash"] = to_hex(*recipient.consent_text_hash);
  }
  set_optional(j, "consent_user_agent", recipient.consent_user_agent);
  set_optional(j, "finished_at", recipient.finished_at);
  set_optional(j, "declined_at", recipient.declined_at);
  set_optional(j, "decline_reason", recipient.decline_reason);
}

void from_json(const json& j, recipient_t& recipient) {
  recipient.id = j.at("id").get<std::string>();
  recipient.name = j.value("name", std::string{});
  recipient.email = j.at("email").get<std::string>();
  recipient.role =
      j.contains("role")
          ? enum_from_json<recipient_role_t>(j.at("role"), "recipient role")
          : recipient_role_t::signer;
  recipient.order = j.value("order", uint32_t{});
  recipient.consent_at = get_optional<timestamp_milliseconds_t>(j, "consent_at");
  if (auto hash = get_optional<std::string>(j, "consent_text_hash")) {
    recipient.consent_text_hash = hash_from_hex(*hash);
  }
  recipient.consent_user_agent =
      get_optional<std::string>(j, "consent_user_agent");
  recipient.finished_at =
      get_optional<timestamp_milliseconds_t>(j, "finished_at");
  recipient.declined_at =
      get_optional<timestamp_milliseconds_t>(j, "declined_at");
  recipient.decline_reason = get_optional<std::string>(j, "decline_reason");
}

void to_json(json& j, const field_t& field) {
  j = json{{"id", field.id},
           {"type", std::string{to_string(field.type)}},
           {"page", field.page},
           {"x", field.rect.x},
           {"y", field.rect.y},
           {"width", field.rect.width},
           {"height", field.rect.height},
           {"recipient_id", field.recipient_id},
           {"required", field.required},
           {"completed", field.completed}};
  if (field.value.has_value()) {
    j["value"] = *field.value;
  }
  set_optional(j, "completed_at", field.completed_at);
}

void from_json(const json& j, field_t& field) {
  field.id = j.at("id").get<std::string>();
  field.type = enum_from_json<field_type_t>(j.at("type"), "field type");
  field.page = j.value("page", uint32_t{1});
  field.rect = field_rect_t{.x = j.value("x", uint32_t{}),
                            .y = j.value("y", uint32_t{}),
                            .width = j.value("width", uint32_t{}),
                            .height = j.value("height", uint32_t{})};
  field.recipient_id = j.at("recipient_id").get<std::string>();
  field.required = j.value("required", true);
  field.completed = j.value("completed", false);
  field.value = get_optional<field_value_t>(j, "value");
  field.completed_at =
      get_optional<timestamp_milliseconds_t>(j, "completed_at");
}

void to_json(json& j, const session_t& session) {
  j = json{{"id", session.id},
           {"document_name", session.document_name},
           {"created_by", session.created_by},
           {"created_at", session.created_at},
           {"updated_at", session.updated_at},
           {"status", std::string{to_string(session.status)}},
           {"signing_mode", std::string{to_string(session.signing_mode)}},
           {"recipients", session.recipients},
           {"fields", session.fields}};
  set_optional(j, "expires_at", session.expires_at);
  set_optional(j, "sender_email", session.sender_email);
  if (session.timestamp_token.has_value()) {
    j["timestamp_token"] = to_base64(*session.timestamp_token);
  }
}

void from_json(const json& j, session_t& session) {
  session.id = j.at("id").get<std::string>();
  session.document_name = j.at("document_name").get<std::string>();
  session.created_by = j.value("created_by", std::string{});
  session.created_at = j.value("created_at", timestamp_milliseconds_t{});
  session.updated_at = j.value("updated_at", session.created_at);
  session.expires_at = get_optional<timestamp_milliseconds_t>(j, "expires_at");
  session.sender_email = get_optional<std::string>(j, "sender_email");
  session.status =
      enum_from_json<session_status_t>(j.at("status"), "session status");
  session.signing_mode =
      j.contains("signing_mode")
          ? enum_from_json<signing_mode_t>(j.at("signing_mode"), "signing mode")
          : signing_mode_t::parallel;
  session.recipients = j.at("recipients").get<std::vector<recipient_t>>();
  session.fields = j.value("fields", std::vector<field_t>{});
  session.timestamp_token.reset();
  if (auto token = get_optional<std::string>(j, "timestamp_token")) {
    session.timestamp_token = try_from_base64(*token);
    if (!session.timestamp_token) {
      throw std::invalid_argument{"invalid timestamp_token encoding"};
    }
  }
}

void to_json(json& j, const signed_submission_t& submission) {
  j = json::object();
  if (submission.consent.has_value()) {
    j["consent"] = json{
        {"consent_text_hash", to_hex(submission.consent->consent_text_hash)},
        {"user_agent", submission.consent->user_agent},
        {"consent_at", submission.consent->consent_at}};
  }
  if (submission.decline.has_value()) {
    auto decline = json{{"declined_at", submission.decline->declined_at}};
    set_optional(decline, "reason", submission.decline->reason);
    j["decline"] = std::move(decline);
  }
  auto signatures = json::array();
  for (const auto& signature : submission.signatures) {
    signatures.push_back(json{{"field_id", signature.field_id},
                              {"value", signature.value},
                              {"completed_at", signature.completed_at}});
  }
  j["signatures"] = std::move(signatures);
  set_optional(j, "completed_at", submission.completed_at);
}

}  // namespace cosign::schema

namespace cosign::wire {

namespace {

using cosign::sync::remote_status_t;

std::optional<json> parse_body(std::string_view body) {
  if (body.empty()) {
    return std::nullopt;
  }
  auto parsed = json::parse(body, nullptr, false);
  if (parsed.is_discarded()) {
    return std::nullopt;
  }
  return parsed;
}

std::string error_message(const std::optional<json>& body,
                          uint16_t http_status) {
  if (body.has_value() && body->is_object()) {
    if (body->contains("error") && body->at("error").is_string()) {
      return body->at("error").get<std::string>();
    }
    if (body->contains("message") && body->at("message").is_string()) {
      return body->at("message").get<std::string>();
    }
  }
  if (http_status == 0) {
    return "no response";
  }
  return "HTTP " + std::to_string(http_status);
}

std::optional<cosign::schema::session_status_t> body_status(
    const std::optional<json>& body) {
  if (!body.has_value() || !body->is_object() || !body->contains("status") ||
      !body->at("status").is_string()) {
    return std::nullopt;
  }
  return cosign::schema::try_from_string<cosign::schema::session_status_t>(
      body->at("status").get<std::string>());
}

}  // namespace

std::optional<cosign::schema::session_t> parse_session(std::string_view body,
                                                       std::string& error) {
  try {
    return json::parse(body).get<cosign::schema::session_t>();
  } catch (const std::exception& e) {
    error = e.what();
    return std::nullopt;
  }
}

std::string serialize_session(const cosign::schema::session_t& session) {
  return json(session).dump();
}

std::string serialize_submission(
    const cosign::schema::recipient_id_t& recipient_id,
    const cosign::schema::signed_submission_t& submission) {
  auto j = json(submission);
  j["recipient_id"] = recipient_id;
  return j.dump();
}

std::string serialize_consent(const cosign::sync::consent_request_t& request) {
  return json{{"recipient_id", request.recipient_id},
              {"user_agent", request.user_agent},
              {"consent_text_hash",
               cosign::schema::to_hex(request.consent_text_hash)}}
      .dump();
}

std::string serialize_decline(const cosign::sync::decline_request_t& request) {
  auto j = json{{"recipient_id", request.recipient_id}};
  if (request.reason.has_value()) {
    j["reason"] = *request.reason;
  }
  return j.dump();
}

cosign::sync::fetch_response_t interpret_fetch(uint16_t http_status,
                                               std::string_view body) {
  auto response = cosign::sync::fetch_response_t{};
  auto parsed = parse_body(body);
  if (http_status == 404) {
    response.status = remote_status_t::not_found;
    response.error = error_message(parsed, http_status);
    return response;
  }
  if (http_status == 401 || http_status == 403) {
    response.status = remote_status_t::invalid_credentials;
    response.error = error_message(parsed, http_status);
    return response;
  }
  if (http_status == 410) {
    response.status = remote_status_t::expired;
    response.error = error_message(parsed, http_status);
    return response;
  }
  if (http_status < 200 || http_status >= 300) {
    response.status = remote_status_t::network_error;
    response.error = error_message(parsed, http_status);
    return response;
  }

  auto error = std::string{};
  auto session = parse_session(body, error);
  if (!session) {
    // A 2xx whose body cannot be read is not a session; treat it as a failed
    // exchange so the caller retries rather than trusting it.
    spdlog::warn("Unreadable session body: {}", error);
    response.status = remote_status_t::network_error;
    response.error = "unreadable session body: " + error;
    return response;
  }
  if (session->status == cosign::schema::session_status_t::expired) {
    response.status = remote_status_t::expired;
  }
  response.session = std::move(session);
  return response;
}

cosign::sync::remote_response_t interpret_mutation(uint16_t http_status,
                                                   std::string_view body) {
  auto response = cosign::sync::remote_response_t{};
  auto parsed = parse_body(body);
  response.session_status = body_status(parsed);
  if (http_status >= 200 && http_status < 300) {
    response.status = remote_status_t::ok;
    if (parsed.has_value() && parsed->is_object()) {
      response.all_signed = parsed->value("all_signed", false);
      if (parsed->contains("download_url") &&
          parsed->at("download_url").is_string()) {
        response.download_url = parsed->at("download_url").get<std::string>();
      }
    }
    return response;
  }

  response.error = error_message(parsed, http_status);
  switch (http_status) {
    case 404:
      response.status = remote_status_t::not_found;
      break;
    case 401:
    case 403:
      response.status = remote_status_t::invalid_credentials;
      break;
    case 409:
      response.status = remote_status_t::conflict;
      break;
    case 410:
      response.status = remote_status_t::expired;
      break;
    default:
      response.status = remote_status_t::network_error;
      break;
  }
  return response;
}

}  // namespace cosign::wire
