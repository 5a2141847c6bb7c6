#include <algorithm>
#include <cosign/schema/session_error_code.hpp>
#include <cosign/session/validation.hpp>
#include <set>
#include <string>
#include <string_view>

namespace cosign::session {

namespace {

constexpr auto kMaxBasisPoints = uint32_t{10000};

cosign::schema::operation_result_t make_validation_error(std::string log,
                                                         std::string info = {}) {
  auto result = cosign::schema::operation_result_t{};
  result.code =
      static_cast<uint32_t>(cosign::schema::session_error_code::validation_error);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{cosign::schema::kSessionCodespace};
  return result;
}

// Ids become key components, so they must not contain the key separator.
bool valid_id(std::string_view id, std::size_t minimum_length) {
  return id.size() >= minimum_length && id.find('|') == std::string_view::npos;
}

}  // namespace

cosign::schema::operation_result_t validate_credentials(
    const cosign::schema::session_credentials_t& credentials) {
  if (!valid_id(credentials.session_id, kMinimumIdLength)) {
    return make_validation_error("invalid session id", credentials.session_id);
  }
  if (!valid_id(credentials.recipient_id, 1)) {
    return make_validation_error("invalid recipient id",
                                 credentials.recipient_id);
  }
  if (credentials.signing_key.size() < kMinimumIdLength) {
    return make_validation_error("invalid signing key");
  }
  return cosign::schema::operation_result_t{};
}

cosign::schema::operation_result_t validate_session(
    const cosign::schema::session_t& session) {
  if (!valid_id(session.id, kMinimumIdLength)) {
    return make_validation_error("invalid session id", session.id);
  }
  if (!valid_id(session.created_by, 1)) {
    return make_validation_error("invalid creator id", session.created_by);
  }
  if (session.document_name.empty()) {
    return make_validation_error("document name is required");
  }
  if (session.status != cosign::schema::session_status_t::active) {
    return make_validation_error("new sessions must be active",
                                 std::string{to_string(session.status)});
  }
  if (session.recipients.empty()) {
    return make_validation_error("session has no recipients");
  }

  auto recipient_ids = std::set<std::string_view>{};
  auto signer_orders = std::set<uint32_t>{};
  for (const auto& recipient : session.recipients) {
    if (!valid_id(recipient.id, 1)) {
      return make_validation_error("invalid recipient id", recipient.id);
    }
    if (!recipient_ids.insert(recipient.id).second) {
      return make_validation_error("duplicate recipient id", recipient.id);
    }
    if (recipient.email.empty()) {
      return make_validation_error("recipient email is required",
                                   recipient.id);
    }
    if (session.signing_mode == cosign::schema::signing_mode_t::sequential &&
        recipient.role == cosign::schema::recipient_role_t::signer &&
        !signer_orders.insert(recipient.order).second) {
      return make_validation_error("duplicate signer order",
                                   std::to_string(recipient.order));
    }
  }

  auto field_ids = std::set<std::string_view>{};
  for (const auto& field : session.fields) {
    if (field.id.empty()) {
      return make_validation_error("field id is required");
    }
    if (!field_ids.insert(field.id).second) {
      return make_validation_error("duplicate field id", field.id);
    }
    if (!recipient_ids.contains(field.recipient_id)) {
      return make_validation_error("field references unknown recipient",
                                   field.id);
    }
    if (field.page == 0) {
      return make_validation_error("field page starts at 1", field.id);
    }
    if (field.rect.x > kMaxBasisPoints || field.rect.y > kMaxBasisPoints ||
        field.rect.width > kMaxBasisPoints - field.rect.x ||
        field.rect.height > kMaxBasisPoints - field.rect.y) {
      return make_validation_error("field lies outside the page", field.id);
    }
    if (field.completed || field.value.has_value()) {
      return make_validation_error("new fields must be empty", field.id);
    }
  }
  return cosign::schema::operation_result_t{};
}

}  // namespace cosign::session
